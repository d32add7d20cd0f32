#include "test_helpers.hpp"
#include <core/credential_vault.hpp>
#include <core/project_config.hpp>
#include <managers/account_provisioner.hpp>
#include <managers/account_registry.hpp>
#include <managers/migration.hpp>
#include <cli/prompter.hpp>

class MigrationTest : public TempDirTest {
protected:
    std::unique_ptr<CredentialVault> vault;
    FakeLoginProvider login;
    std::istringstream in;
    std::ostringstream out;
    std::unique_ptr<StreamPrompter> prompter;
    std::unique_ptr<AccountProvisioner> provisioner;
    std::unique_ptr<AccountRegistry> registry;
    std::unique_ptr<ProjectConfig> config;
    std::unique_ptr<MigrationEngine> migration;

    void SetUp() override {
        TempDirTest::SetUp();
        vault = std::make_unique<CredentialVault>(test_dir / "vault");
        prompter = std::make_unique<StreamPrompter>(in, out);
        provisioner = std::make_unique<AccountProvisioner>(*vault, login, *prompter);
        registry = std::make_unique<AccountRegistry>(*vault, *provisioner, *prompter);
        config = std::make_unique<ProjectConfig>(test_dir / "claspConfig.txt");
        migration = std::make_unique<MigrationEngine>(test_dir / "deploymentId.txt",
                                                      *config, *registry, *prompter);
        ASSERT_TRUE(vault->store("alpha", "a").is_ok());
    }

    void feed(const std::string& input) {
        in.str(input);
        in.clear();
    }
};

TEST_F(MigrationTest, NotNeededWithoutLegacyFile) {
    EXPECT_FALSE(migration->needed());
}

TEST_F(MigrationTest, NotNeededOnceNewFileExists) {
    write_file(test_dir / "deploymentId.txt", "AKfy123\n");
    write_file(test_dir / "claspConfig.txt", "account=alpha\n");
    EXPECT_FALSE(migration->needed());
}

TEST_F(MigrationTest, ConvertsLegacyFile) {
    write_file(test_dir / "deploymentId.txt", "  AKfy123\r\n");
    ASSERT_TRUE(migration->needed());
    feed("1\n");

    auto r = migration->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "alpha");

    EXPECT_EQ(read_back(test_dir / "claspConfig.txt"), "deploymentId=AKfy123\naccount=alpha\n");
    EXPECT_FALSE(fs::exists(test_dir / "deploymentId.txt"));
    EXPECT_FALSE(migration->needed());

    std::string text = out.str();
    EXPECT_NE(text.find("Old deploymentId.txt file detected"), std::string::npos);
    EXPECT_NE(text.find("Migration completed. New file: claspConfig.txt"), std::string::npos);
    EXPECT_NE(text.find("Old file deleted: deploymentId.txt"), std::string::npos);
}

TEST_F(MigrationTest, TrailingSpacesAndBareCarriageReturn) {
    write_file(test_dir / "deploymentId.txt", "  AKfycbwTEST123  \r");
    feed("1\n");

    auto r = migration->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_back(test_dir / "claspConfig.txt"),
              "deploymentId=AKfycbwTEST123\naccount=alpha\n");
    EXPECT_FALSE(fs::exists(test_dir / "deploymentId.txt"));
}

TEST_F(MigrationTest, EmptyLegacyFileGivesEmptyDeploymentId) {
    write_file(test_dir / "deploymentId.txt", "");
    feed("1\n");

    auto r = migration->run();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(config->read("deploymentId").value_or("missing"), "");
    EXPECT_EQ(config->read("account").value_or(""), "alpha");
}

TEST_F(MigrationTest, AbortedSelectionKeepsLegacyFile) {
    write_file(test_dir / "deploymentId.txt", "AKfy123\n");
    feed("");

    auto r = migration->run();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Environment);
    EXPECT_TRUE(fs::exists(test_dir / "deploymentId.txt"));
    EXPECT_FALSE(fs::exists(test_dir / "claspConfig.txt"));
}
