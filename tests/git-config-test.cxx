#include "sandbox.hxx"

#include "git-config.hxx"
#include "reader.hxx"
#include "repository.hxx"
#include "utility.hxx"
#include "variable.hxx"

#include <git2/config.h>
#include <git2/repository.h>
#include <gtest/gtest.h>

#include <sstream>

class GitConfig: public ConfigSandbox {
protected:
	std::optional<std::string> local(const std::string& name)
	{
		return gitConfigLocal({name}, repoDir()).find(canonicalVariableName(name))->value;
	}

	std::optional<std::string> global(const std::string& name)
	{
		return gitConfigGlobal({name}, repoDir()).find(canonicalVariableName(name))->value;
	}

	bool localBool(const char* name)
	{
		RepositoryPtr repo{openRepository(repoDir())};
		git_config* config;
		LibgitError::check(git_repository_config(&config, repo.get()));
		int value{};
		int error = git_config_get_bool(&value, config, name);
		git_config_free(config);
		LibgitError::check(error);
		return value != 0;
	}

	std::ostringstream notices_;
};

TEST_F(GitConfig, UnknownVariableHasNoValue)
{
	ConfigSnapshot snapshot{gitConfig({"githug.lol"}, ConfigScope::DeFacto, repoDir())};
	ASSERT_EQ(snapshot.size(), 1u);
	EXPECT_EQ(snapshot.begin()->name, "githug.lol");
	EXPECT_FALSE(snapshot.begin()->value.has_value());
}

TEST_F(GitConfig, LocalAssignmentsAreReadBackInRequestedOrder)
{
	gitConfigLocal({Argument::assign("user.name", "louise"), Argument::assign("user.email", "louise@example.org")},
	               repoDir());

	ConfigSnapshot snapshot{gitConfigLocal({"user.name", "color.branch", "user.email"}, repoDir())};

	ConfigSnapshot expected;
	expected.set("user.name", "louise");
	expected.set("color.branch", std::nullopt);
	expected.set("user.email", "louise@example.org");
	EXPECT_EQ(snapshot, expected);
}

TEST_F(GitConfig, QueryOrderIsTheRequestedOne)
{
	gitConfigLocal({Argument::assign("a.x", "1"), Argument::assign("b.x", "2"), Argument::assign("c.x", "3")},
	               repoDir());

	ConfigSnapshot snapshot{gitConfigLocal({"b.x", "a.x", "c.x"}, repoDir())};
	std::vector<std::string> names;
	for (const ConfigSnapshot::Entry& entry: snapshot) {
		names.push_back(entry.name);
	}
	EXPECT_EQ(names, (std::vector<std::string>{"b.x", "a.x", "c.x"}));
}

TEST_F(GitConfig, LocalOverridesGlobalInDeFacto)
{
	gitConfigGlobal({Argument::assign("user.name", "thelma"), Argument::assign("user.email", "thelma@example.org")},
	                repoDir());
	gitConfigLocal({Argument::assign("user.email", "louise@example.org")}, repoDir());

	ConfigSnapshot snapshot{gitConfig({"user.name", "user.email"}, ConfigScope::DeFacto, repoDir())};
	EXPECT_EQ(snapshot.find("user.name")->value, "thelma");
	EXPECT_EQ(snapshot.find("user.email")->value, "louise@example.org");

	EXPECT_FALSE(local("user.name").has_value());
	EXPECT_EQ(global("user.email"), "thelma@example.org");
}

TEST_F(GitConfig, EmptyQueryListsEverything)
{
	gitConfigGlobal({Argument::assign("user.name", "thelma")}, repoDir());

	ConfigSnapshot all{gitConfig({}, ConfigScope::DeFacto, repoDir())};
	ASSERT_NE(all.find("user.name"), nullptr);
	ASSERT_NE(all.find("core.bare"), nullptr);
	EXPECT_EQ(all.find("core.bare")->value, "false");

	ConfigSnapshot globalOnly{gitConfigGlobal({}, repoDir())};
	EXPECT_EQ(globalOnly.size(), 1u);
}

TEST_F(GitConfig, WriteReturnsPreviousValuesThatRestore)
{
	gitConfigLocal({Argument::assign("user.name", "louise")}, repoDir());
	ConfigSnapshot before{gitConfigLocal({}, repoDir())};

	ConfigSnapshot previous{gitConfigLocal(
		{Argument::assign("user.name", "oops"), Argument::assign("user.email", "oops@example.org")}, repoDir())};
	EXPECT_EQ(previous.find("user.name")->value, "louise");
	EXPECT_FALSE(previous.find("user.email")->value.has_value());
	EXPECT_EQ(local("user.name"), "oops");
	EXPECT_EQ(local("user.email"), "oops@example.org");

	gitConfigLocal({previous}, repoDir());
	EXPECT_EQ(local("user.name"), "louise");
	EXPECT_FALSE(local("user.email").has_value());
	EXPECT_EQ(gitConfigLocal({}, repoDir()), before);
}

TEST_F(GitConfig, ImplicitBooleanIsRestoredAsTrue)
{
	appendToFile(localConfigFile(), "[core]\n\tfoo\n");
	EXPECT_EQ(local("core.foo"), "true");

	ConfigSnapshot previous{gitConfigLocal({Argument::assign("core.foo", "x")}, repoDir())};
	EXPECT_EQ(previous.find("core.foo")->value, "true");

	gitConfigLocal({previous}, repoDir());
	EXPECT_TRUE(localBool("core.foo"));
}

TEST_F(GitConfig, UnsetReturnsPreviousValue)
{
	gitConfigGlobal({Argument::assign("color.ui", "auto")}, repoDir());
	ConfigSnapshot previous{gitConfigGlobal({Argument::unset("color.ui")}, repoDir())};
	EXPECT_EQ(previous.find("color.ui")->value, "auto");
	EXPECT_FALSE(global("color.ui").has_value());

	gitConfigGlobal({previous}, repoDir());
	EXPECT_EQ(global("color.ui"), "auto");
}

TEST_F(GitConfig, SettingTwiceIsIdempotent)
{
	gitConfigLocal({Argument::assign("user.name", "louise")}, repoDir());
	ConfigSnapshot once{gitConfigLocal({}, repoDir())};
	gitConfigLocal({Argument::assign("user.name", "louise")}, repoDir());
	EXPECT_EQ(gitConfigLocal({}, repoDir()), once);

	EXPECT_NO_THROW(gitConfigLocal({Argument::unset("color.branch")}, repoDir()));
	EXPECT_NO_THROW(gitConfigLocal({Argument::unset("color.branch")}, repoDir()));
}

TEST_F(GitConfig, OutsideOfRepositoryDeFactoIsGlobal)
{
	gitConfigGlobal({Argument::assign("user.name", "thelma")}, plainDir());

	ConfigSnapshot snapshot{gitConfig({"user.name", "user.email"}, ConfigScope::DeFacto, plainDir())};
	EXPECT_EQ(snapshot.find("user.name")->value, "thelma");
	EXPECT_FALSE(snapshot.find("user.email")->value.has_value());
	EXPECT_TRUE(gitConfigLocal({}, plainDir()).empty());
}

TEST_F(GitConfig, OutsideOfRepositoryLocalWriteFails)
{
	try {
		gitConfigLocal({Argument::assign("user.name", "louise")}, plainDir());
		FAIL() << "expected NoRepository";
	} catch (const NoRepository& e) {
		EXPECT_NE(std::string{e.what()}.find(plainDir().string()), std::string::npos);
	}
}

TEST_F(GitConfig, DeFactoWriteGoesToLocalWithNotice)
{
	ConfigSnapshot previous{
		gitConfig({Argument::assign("user.name", "louise")}, ConfigScope::DeFacto, repoDir(), notices_)};
	EXPECT_EQ(notices_.str(), "setting where = \"local\"\n");
	EXPECT_FALSE(previous.find("user.name")->value.has_value());

	ConfigSnapshot redirected{gitConfigLocal({}, repoDir())};
	gitConfigLocal({Argument::unset("user.name")}, repoDir());
	gitConfig({Argument::assign("user.name", "louise")}, ConfigScope::Local, repoDir(), notices_);
	EXPECT_EQ(gitConfigLocal({}, repoDir()), redirected);
	EXPECT_EQ(notices_.str(), "setting where = \"local\"\n");
	EXPECT_FALSE(global("user.name").has_value());
}

TEST_F(GitConfig, PreviousValuesComeFromTheWrittenScope)
{
	gitConfigGlobal({Argument::assign("user.name", "thelma")}, repoDir());

	ConfigSnapshot previous{
		gitConfig({Argument::assign("user.name", "louise")}, ConfigScope::DeFacto, repoDir(), notices_)};
	EXPECT_FALSE(previous.find("user.name")->value.has_value());

	gitConfigLocal({previous}, repoDir());
	EXPECT_FALSE(local("user.name").has_value());
	EXPECT_EQ(global("user.name"), "thelma");
}

TEST_F(GitConfig, BareNamesInAWriteAreOnlyReported)
{
	gitConfigLocal({Argument::assign("user.email", "louise@example.org")}, repoDir());

	ConfigSnapshot previous{gitConfigLocal({"user.email", Argument::assign("user.name", "louise")}, repoDir())};
	EXPECT_EQ(previous.find("user.email")->value, "louise@example.org");
	EXPECT_FALSE(previous.find("user.name")->value.has_value());
	EXPECT_EQ(local("user.email"), "louise@example.org");
}

TEST_F(GitConfig, DuplicateAssignmentsLastOneWins)
{
	ConfigSnapshot previous{gitConfigLocal(
		{Argument::assign("user.name", "a"), Argument::assign("User.Name", "b")}, repoDir())};
	EXPECT_EQ(previous.size(), 1u);
	EXPECT_EQ(local("user.name"), "b");
}

TEST_F(GitConfig, SubsectionKeepsItsCase)
{
	gitConfigLocal({Argument::assign("branch.Main.remote", "origin")}, repoDir());
	EXPECT_EQ(local("BRANCH.Main.REMOTE"), "origin");
	EXPECT_FALSE(local("branch.main.remote").has_value());
}

TEST_F(GitConfig, MultivarInStoreFailsTheRead)
{
	appendToFile(localConfigFile(), "[remote \"origin\"]\n\tfetch = a\n\tfetch = b\n");
	EXPECT_THROW(gitConfigLocal({"user.name"}, repoDir()), MultiValuedVariable);
	EXPECT_THROW(gitConfigLocal({Argument::assign("user.name", "louise")}, repoDir()), MultiValuedVariable);
	EXPECT_FALSE(gitConfigGlobal({"remote.origin.fetch"}, repoDir()).find("remote.origin.fetch")->value.has_value());
}

TEST_F(GitConfig, SnapshotIsNotLiveView)
{
	gitConfigLocal({Argument::assign("user.name", "louise")}, repoDir());
	ConfigSnapshot snapshot{gitConfigLocal({"user.name"}, repoDir())};
	gitConfigLocal({Argument::assign("user.name", "thelma")}, repoDir());
	EXPECT_EQ(snapshot.find("user.name")->value, "louise");
}
