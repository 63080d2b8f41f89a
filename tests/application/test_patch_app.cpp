#include "anchorpatch/application/patch_app.hpp"
#include "anchorpatch/core/disambiguation.hpp"
#include "anchorpatch/parsers/patch_parser.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace anchorpatch {

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class MockTerminal : public ITerminal {
public:
    MOCK_METHOD(Choice, resolve, (const DisambiguationRequest& request), (override));
    MOCK_METHOD(bool, is_interactive, (), (override));
    MOCK_METHOD(std::string, prompt_line, (const std::string& question), (override));
    MOCK_METHOD(std::string, read_patch_text, (), (override));
    MOCK_METHOD(std::optional<size_t>, choose_patch_file, (const std::vector<std::string>& paths), (override));
    MOCK_METHOD(bool, confirm, (const std::string& question), (override));
    MOCK_METHOD(void, show_report, (const PatchReport& report), (override));
    MOCK_METHOD(void, show_message, (const std::string& message), (override));
};

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::optional<Document>, read_document, (const std::string& path), (override));
    MOCK_METHOD(bool, write_document, (const Document& document, const std::string& path), (override));
    MOCK_METHOD(std::optional<std::string>, create_backup, (const std::string& path), (override));
    MOCK_METHOD(std::optional<std::string>, read_text, (const std::string& path), (override));
    MOCK_METHOD(std::vector<std::string>, list_patch_files, (const std::string& directory), (override));
    MOCK_METHOD(bool, file_exists, (const std::string& path), (override));
};

class MockRunLog : public IRunLog {
public:
    MOCK_METHOD(void, log_event,
                (const std::string& event_type, const std::string& message, const std::string& details),
                (override));
};

class PatchAppTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_terminal_ = std::make_unique<NiceMock<MockTerminal>>();
        mock_filesystem_ = std::make_unique<NiceMock<MockFileSystem>>();
        mock_log_ = std::make_unique<NiceMock<MockRunLog>>();

        // Store raw pointers for expectations
        terminal_ptr_ = mock_terminal_.get();
        filesystem_ptr_ = mock_filesystem_.get();
        log_ptr_ = mock_log_.get();

        batch_config_.target_file = "app.txt";
        batch_config_.patch_file = "fix.diff";
        batch_config_.interactive = false;
        batch_config_.assume_yes = true;

        ON_CALL(*filesystem_ptr_, read_document("app.txt")).WillByDefault(Return(target_));
        ON_CALL(*filesystem_ptr_, create_backup("app.txt"))
            .WillByDefault(Return(std::optional<std::string>("app_010126_1200.bak")));
        ON_CALL(*filesystem_ptr_, write_document(_, _)).WillByDefault(Return(true));
        EXPECT_CALL(*log_ptr_, log_event(_, _, _)).Times(AnyNumber());
    }

    auto make_app() -> PatchApp
    {
        return PatchApp(std::move(mock_terminal_), std::move(mock_filesystem_),
                        std::make_unique<PatchParser>(), std::move(mock_log_));
    }

    auto given_patch(const std::string& text) -> void
    {
        ON_CALL(*filesystem_ptr_, read_text("fix.diff"))
            .WillByDefault(Return(std::optional<std::string>(text)));
    }

    std::unique_ptr<NiceMock<MockTerminal>> mock_terminal_;
    std::unique_ptr<NiceMock<MockFileSystem>> mock_filesystem_;
    std::unique_ptr<NiceMock<MockRunLog>> mock_log_;

    // Raw pointers for setting expectations
    NiceMock<MockTerminal>* terminal_ptr_ = nullptr;
    NiceMock<MockFileSystem>* filesystem_ptr_ = nullptr;
    NiceMock<MockRunLog>* log_ptr_ = nullptr;

    Document target_ = create_document({"alpha", "beta", "gamma"});
    Config batch_config_;
};

TEST_F(PatchAppTest, BatchRunWithYesBacksUpAndWrites)
{
    given_patch("@@ -2,1 +2,1 @@\n-beta\n+BETA\n");
    auto expected = create_document({"alpha", "BETA", "gamma"});

    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*filesystem_ptr_, create_backup("app.txt"));
        EXPECT_CALL(*filesystem_ptr_, write_document(expected, "app.txt")).WillOnce(Return(true));
    }
    EXPECT_CALL(*log_ptr_, log_event("HUNK_APPLIED", "Hunk #1", _));
    EXPECT_CALL(*log_ptr_, log_event("BACKUP_CREATED", "app_010126_1200.bak", _));
    EXPECT_CALL(*log_ptr_, log_event("FILE_SAVED", "app.txt", _));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, DryRunNeverWrites)
{
    given_patch("@@\n-beta\n+BETA\n");
    batch_config_.dry_run = true;

    EXPECT_CALL(*filesystem_ptr_, write_document(_, _)).Times(0);
    EXPECT_CALL(*filesystem_ptr_, create_backup(_)).Times(0);
    EXPECT_CALL(*log_ptr_, log_event("CHANGES_DISCARDED", "dry run", _));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, PatchWithoutHunksFails)
{
    given_patch("nothing to see here\n");

    EXPECT_CALL(*filesystem_ptr_, write_document(_, _)).Times(0);
    EXPECT_CALL(*log_ptr_, log_event("ERROR", HasSubstr("no valid hunks"), _));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 1);
}

TEST_F(PatchAppTest, UnreadableTargetFails)
{
    ON_CALL(*filesystem_ptr_, read_document("app.txt")).WillByDefault(Return(std::nullopt));

    EXPECT_CALL(*log_ptr_, log_event("ERROR", HasSubstr("cannot read target file app.txt"), _));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 1);
}

TEST_F(PatchAppTest, UnreadablePatchFails)
{
    ON_CALL(*filesystem_ptr_, read_text("fix.diff")).WillByDefault(Return(std::nullopt));

    EXPECT_CALL(*log_ptr_, log_event("ERROR", HasSubstr("cannot read patch from fix.diff"), _));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 1);
}

TEST_F(PatchAppTest, BatchWithoutYesDiscards)
{
    given_patch("@@\n-beta\n+BETA\n");
    batch_config_.assume_yes = false;

    EXPECT_CALL(*filesystem_ptr_, write_document(_, _)).Times(0);
    EXPECT_CALL(*terminal_ptr_, confirm(_)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, BackupFailureLeavesFileUnchanged)
{
    given_patch("@@\n-beta\n+BETA\n");
    ON_CALL(*filesystem_ptr_, create_backup("app.txt")).WillByDefault(Return(std::nullopt));

    EXPECT_CALL(*filesystem_ptr_, write_document(_, _)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 1);
}

TEST_F(PatchAppTest, NoBackupOptionSkipsBackup)
{
    given_patch("@@\n-beta\n+BETA\n");
    batch_config_.create_backup = false;

    EXPECT_CALL(*filesystem_ptr_, create_backup(_)).Times(0);
    EXPECT_CALL(*filesystem_ptr_, write_document(_, "app.txt")).WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, WriteFailureIsReported)
{
    given_patch("@@\n-beta\n+BETA\n");
    ON_CALL(*filesystem_ptr_, write_document(_, _)).WillByDefault(Return(false));

    EXPECT_CALL(*log_ptr_, log_event("ERROR", HasSubstr("cannot write app.txt"), _));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 1);
}

TEST_F(PatchAppTest, BatchAmbiguityFollowsPolicy)
{
    ON_CALL(*filesystem_ptr_, read_document("app.txt"))
        .WillByDefault(Return(create_document({"k", "x", "k", "y"})));
    given_patch("@@ k\n+after\n");
    batch_config_.ambiguity = AmbiguityPolicy::FIRST;

    EXPECT_CALL(*terminal_ptr_, resolve(_)).Times(0);
    EXPECT_CALL(*log_ptr_, log_event("DISAMBIGUATION", "Hunk #1: 2 candidates", HasSubstr("Choice: candidate 1")));
    EXPECT_CALL(*filesystem_ptr_,
                write_document(create_document({"k", "after", "x", "k", "y"}), "app.txt"))
        .WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, InteractiveAmbiguityAsksTerminal)
{
    ON_CALL(*filesystem_ptr_, read_document("app.txt"))
        .WillByDefault(Return(create_document({"k", "x", "k", "y"})));
    given_patch("@@ k\n+after\n");
    batch_config_.interactive = true;
    batch_config_.assume_yes = false;

    ON_CALL(*terminal_ptr_, is_interactive()).WillByDefault(Return(true));
    EXPECT_CALL(*terminal_ptr_, resolve(_))
        .WillOnce(Return(Choice{.action = ChoiceAction::SELECT, .index = 1}));
    EXPECT_CALL(*terminal_ptr_, confirm(HasSubstr("Write changes to app.txt"))).WillOnce(Return(true));
    EXPECT_CALL(*filesystem_ptr_,
                write_document(create_document({"k", "x", "k", "after", "y"}), "app.txt"))
        .WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, DeclinedConfirmationDiscards)
{
    given_patch("@@\n-beta\n+BETA\n");
    batch_config_.interactive = true;
    batch_config_.assume_yes = false;

    ON_CALL(*terminal_ptr_, is_interactive()).WillByDefault(Return(true));
    EXPECT_CALL(*terminal_ptr_, confirm(_)).WillOnce(Return(false));
    EXPECT_CALL(*filesystem_ptr_, write_document(_, _)).Times(0);
    EXPECT_CALL(*log_ptr_, log_event("CHANGES_DISCARDED", "not confirmed", _));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, CancelBeforeChangesFails)
{
    ON_CALL(*filesystem_ptr_, read_document("app.txt"))
        .WillByDefault(Return(create_document({"k", "k"})));
    given_patch("@@ k\n+after\n");
    batch_config_.ambiguity = AmbiguityPolicy::CANCEL;

    EXPECT_CALL(*filesystem_ptr_, write_document(_, _)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 1);
}

TEST_F(PatchAppTest, AllHunksSkippedWritesNothing)
{
    given_patch("@@ missing\n+x\n");

    EXPECT_CALL(*filesystem_ptr_, write_document(_, _)).Times(0);
    EXPECT_CALL(*terminal_ptr_, show_report(_));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, InteractivePromptsForTargetAndPastedPatch)
{
    Config config;
    ON_CALL(*terminal_ptr_, is_interactive()).WillByDefault(Return(true));

    EXPECT_CALL(*terminal_ptr_, prompt_line(_)).WillOnce(Return("app.txt  "));
    EXPECT_CALL(*filesystem_ptr_, list_patch_files(_)).WillOnce(Return(std::vector<std::string>{}));
    EXPECT_CALL(*terminal_ptr_, choose_patch_file(_)).Times(0);
    EXPECT_CALL(*terminal_ptr_, read_patch_text()).WillOnce(Return("@@\n-alpha\n+ALPHA\n"));
    EXPECT_CALL(*terminal_ptr_, confirm(_)).WillOnce(Return(true));
    EXPECT_CALL(*filesystem_ptr_, write_document(create_document({"ALPHA", "beta", "gamma"}), "app.txt"))
        .WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(PatchAppTest, InteractiveChoosesDiffFile)
{
    Config config;
    config.target_file = "app.txt";
    ON_CALL(*terminal_ptr_, is_interactive()).WillByDefault(Return(true));
    ON_CALL(*terminal_ptr_, confirm(_)).WillByDefault(Return(true));

    EXPECT_CALL(*filesystem_ptr_, list_patch_files(_))
        .WillOnce(Return(std::vector<std::string>{"a.diff", "b.diff"}));
    EXPECT_CALL(*terminal_ptr_, choose_patch_file(_)).WillOnce(Return(std::optional<size_t>(1)));
    EXPECT_CALL(*filesystem_ptr_, read_text("b.diff"))
        .WillOnce(Return(std::optional<std::string>("@@\n-gamma\n")));
    EXPECT_CALL(*filesystem_ptr_, write_document(create_document({"alpha", "beta"}), "app.txt"))
        .WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(config), 0);
}

TEST_F(PatchAppTest, BatchWithoutTargetFails)
{
    batch_config_.target_file.clear();

    EXPECT_CALL(*terminal_ptr_, prompt_line(_)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 1);
}

TEST_F(PatchAppTest, PythonIndentationFixedWithYes)
{
    batch_config_.target_file = "tool.py";
    ON_CALL(*filesystem_ptr_, read_document("tool.py"))
        .WillByDefault(Return(create_document({"def f():", "\tx = 1", "    return x"})));
    ON_CALL(*filesystem_ptr_, create_backup("tool.py"))
        .WillByDefault(Return(std::optional<std::string>("tool_010126_1200.bak")));
    given_patch("@@\n-\tx = 1\n+\tx = 2\n");

    EXPECT_CALL(*log_ptr_, log_event("INDENTATION_CORRECTED", "tool.py", _));
    EXPECT_CALL(*filesystem_ptr_,
                write_document(create_document({"def f():", "    x = 2", "    return x"}), "tool.py"))
        .WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, IndentationFixCanBeDisabled)
{
    batch_config_.target_file = "tool.py";
    batch_config_.fix_indentation = false;
    ON_CALL(*filesystem_ptr_, read_document("tool.py"))
        .WillByDefault(Return(create_document({"def f():", "\tx = 1", "    return x"})));
    ON_CALL(*filesystem_ptr_, create_backup("tool.py"))
        .WillByDefault(Return(std::optional<std::string>("tool_010126_1200.bak")));
    given_patch("@@\n-\tx = 1\n+\tx = 2\n");

    EXPECT_CALL(*log_ptr_, log_event("INDENTATION_CORRECTED", _, _)).Times(0);
    EXPECT_CALL(*filesystem_ptr_,
                write_document(create_document({"def f():", "\tx = 2", "    return x"}), "tool.py"))
        .WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

TEST_F(PatchAppTest, RevertOptionReachesEngine)
{
    ON_CALL(*filesystem_ptr_, read_document("app.txt"))
        .WillByDefault(Return(create_document({"alpha", "BETA", "gamma"})));
    given_patch("@@ -2,1 +2,1 @@\n-beta\n+BETA\n");
    batch_config_.revert = true;

    EXPECT_CALL(*filesystem_ptr_, write_document(target_, "app.txt")).WillOnce(Return(true));

    auto app = make_app();
    EXPECT_EQ(app.run(batch_config_), 0);
}

} // namespace anchorpatch
