#include "test_helpers.hpp"
#include <core/credential_vault.hpp>
#include <core/project_config.hpp>
#include <managers/account_provisioner.hpp>
#include <managers/account_registry.hpp>
#include <managers/account_switcher.hpp>
#include <managers/migration.hpp>
#include <managers/bootstrap.hpp>
#include <cli/prompter.hpp>

class BootstrapTest : public TempDirTest {
protected:
    std::unique_ptr<CredentialVault> vault;
    FakeLoginProvider login;
    std::istringstream in;
    std::ostringstream out;
    std::unique_ptr<StreamPrompter> prompter;
    std::unique_ptr<AccountProvisioner> provisioner;
    std::unique_ptr<AccountRegistry> registry;
    std::unique_ptr<AccountSwitcher> switcher;
    std::unique_ptr<ProjectConfig> config;
    std::unique_ptr<MigrationEngine> migration;
    std::unique_ptr<Bootstrap> bootstrap;

    fs::path project() { return test_dir / "project"; }
    fs::path active_slot() { return test_dir / "home" / ".clasprc.json"; }

    void SetUp() override {
        TempDirTest::SetUp();
        fs::create_directories(project());
        vault = std::make_unique<CredentialVault>(test_dir / "vault");
        prompter = std::make_unique<StreamPrompter>(in, out);
        provisioner = std::make_unique<AccountProvisioner>(*vault, login, *prompter);
        registry = std::make_unique<AccountRegistry>(*vault, *provisioner, *prompter);
        switcher = std::make_unique<AccountSwitcher>(*vault, active_slot());
        config = std::make_unique<ProjectConfig>(project() / "claspConfig.txt");
        migration = std::make_unique<MigrationEngine>(project() / "deploymentId.txt",
                                                      *config, *registry, *prompter);
        bootstrap = std::make_unique<Bootstrap>(*config, *migration, *registry,
                                                *provisioner, *switcher, *prompter);
    }

    void feed(const std::string& input) {
        in.str(input);
        in.clear();
    }
};

TEST_F(BootstrapTest, ConfiguredAccountIsActivatedWithoutPrompting) {
    ASSERT_TRUE(vault->store("work", "W").is_ok());
    write_file(project() / "claspConfig.txt", "deploymentId=AK\naccount=work\n");
    feed("");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "work");
    EXPECT_EQ(read_back(active_slot()), "W");
    EXPECT_EQ(login.calls, 0);
}

TEST_F(BootstrapTest, FirstRunCreatesAccountAndConfig) {
    login.blob = "{\"token\":\"work\"}";
    feed("N\nwork\n\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "work");

    EXPECT_EQ(login.calls, 1);
    EXPECT_EQ(vault->fetch("work").value, "{\"token\":\"work\"}");
    EXPECT_EQ(read_back(project() / "claspConfig.txt"), "account=work\n");
    EXPECT_EQ(read_back(active_slot()), "{\"token\":\"work\"}");

    std::string text = out.str();
    EXPECT_NE(text.find("No project configuration found."), std::string::npos);
    EXPECT_NE(text.find("Configuration saved to claspConfig.txt"), std::string::npos);
}

TEST_F(BootstrapTest, ConfigWithoutAccountPromptsAndKeepsOtherKeys) {
    ASSERT_TRUE(vault->store("work", "W").is_ok());
    write_file(project() / "claspConfig.txt", "deploymentId=AK\n");
    feed("1\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "work");
    EXPECT_EQ(read_back(project() / "claspConfig.txt"), "deploymentId=AK\naccount=work\n");
    EXPECT_NE(out.str().find("exists but has no account configured"), std::string::npos);
}

TEST_F(BootstrapTest, EmptyAccountValueCountsAsUnset) {
    ASSERT_TRUE(vault->store("work", "W").is_ok());
    write_file(project() / "claspConfig.txt", "account=\n");
    feed("1\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(config->read("account").value_or(""), "work");
}

TEST_F(BootstrapTest, LegacyProjectIsMigrated) {
    ASSERT_TRUE(vault->store("alpha", "A").is_ok());
    write_file(project() / "deploymentId.txt", "AKfy123\n");
    feed("1\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "alpha");
    EXPECT_EQ(read_back(project() / "claspConfig.txt"), "deploymentId=AKfy123\naccount=alpha\n");
    EXPECT_FALSE(fs::exists(project() / "deploymentId.txt"));
    EXPECT_EQ(read_back(active_slot()), "A");
}

TEST_F(BootstrapTest, SecondRunDoesNotMigrateAgain) {
    ASSERT_TRUE(vault->store("alpha", "A").is_ok());
    write_file(project() / "deploymentId.txt", "  AKfycbwTEST123  \r");
    feed("1\n");
    ASSERT_TRUE(bootstrap->run().is_ok());
    std::string migrated = read_back(project() / "claspConfig.txt");
    EXPECT_EQ(migrated, "deploymentId=AKfycbwTEST123\naccount=alpha\n");

    // A legacy file reappearing later is left alone
    write_file(project() / "deploymentId.txt", "AKother\n");
    out.str("");
    feed("");

    auto again = bootstrap->run();
    ASSERT_TRUE(again.is_ok()) << again.error;
    EXPECT_EQ(again.value, "alpha");
    EXPECT_EQ(read_back(project() / "claspConfig.txt"), migrated);
    EXPECT_TRUE(fs::exists(project() / "deploymentId.txt"));
    EXPECT_EQ(out.str().find("Migrating"), std::string::npos);
}

TEST_F(BootstrapTest, GhostAccountRecreatedOnRequest) {
    write_file(project() / "claspConfig.txt", "account=ghost\n");
    login.blob = "G";
    feed("1\n\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "ghost");
    EXPECT_EQ(login.calls, 1);
    EXPECT_TRUE(vault->contains("ghost"));
    EXPECT_EQ(read_back(active_slot()), "G");
    EXPECT_EQ(config->read("account").value_or(""), "ghost");

    std::string text = out.str();
    EXPECT_NE(text.find("Credentials not found for account: ghost"), std::string::npos);
    EXPECT_NE(text.find("1) Create the account 'ghost' now"), std::string::npos);
}

TEST_F(BootstrapTest, GhostAccountReplacedBySelection) {
    ASSERT_TRUE(vault->store("alpha", "A").is_ok());
    write_file(project() / "claspConfig.txt", "deploymentId=AK\naccount=ghost\n");
    feed("2\n1\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "alpha");
    EXPECT_EQ(login.calls, 0);
    EXPECT_EQ(read_back(project() / "claspConfig.txt"), "deploymentId=AK\naccount=alpha\n");
    EXPECT_EQ(read_back(active_slot()), "A");
}

TEST_F(BootstrapTest, UnusableConfiguredNameGoesStraightToSelection) {
    ASSERT_TRUE(vault->store("alpha", "A").is_ok());
    write_file(project() / "claspConfig.txt", "account=../../etc/passwd\n");
    feed("1\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "alpha");
    EXPECT_EQ(out.str().find("Create the account"), std::string::npos);
    EXPECT_EQ(config->read("account").value_or(""), "alpha");
}

TEST_F(BootstrapTest, FailedLoginLeavesActiveSlotUntouched) {
    write_file(active_slot(), "previous");
    write_file(project() / "claspConfig.txt", "account=ghost\n");
    login.fail = true;
    feed("1\n\n");

    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ExternalTool);
    EXPECT_FALSE(vault->contains("ghost"));
    EXPECT_EQ(read_back(active_slot()), "previous");
}

TEST_F(BootstrapTest, ClosedInputAbortsFirstRun) {
    feed("");
    auto r = bootstrap->run();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Environment);
    EXPECT_FALSE(fs::exists(project() / "claspConfig.txt"));
    EXPECT_FALSE(fs::exists(active_slot()));
}
