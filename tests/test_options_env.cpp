//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_options_env.cpp
// Purpose: GoogleTests for environment-driven token endpoint configuration
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "oidc/Options.h"

using namespace oidc;

namespace {
struct EnvGuard {
    const char* name;
    explicit EnvGuard(const char* n) : name(n) { ::unsetenv(name); }
    ~EnvGuard() { ::unsetenv(name); }
};
}

TEST(OptionsEnv, DefaultsWhenUnset) {
    EnvGuard a("OIDC_AUTHORIZATION_ENDPOINT_PATH");
    EnvGuard t("OIDC_TOKEN_ENDPOINT_PATH");
    auto o = LoadTokenEndpointOptionsFromEnv(TokenEndpointOptions{});
    EXPECT_EQ(o.authorizationEndpointPath, "/connect/authorize");
    EXPECT_EQ(o.tokenEndpointPath, "/connect/token");
}

TEST(OptionsEnv, OverridesPaths) {
    EnvGuard a("OIDC_AUTHORIZATION_ENDPOINT_PATH");
    EnvGuard t("OIDC_TOKEN_ENDPOINT_PATH");
    ::setenv("OIDC_TOKEN_ENDPOINT_PATH", "/oauth2/token", 1);
    auto o = LoadTokenEndpointOptionsFromEnv(TokenEndpointOptions{});
    EXPECT_EQ(o.tokenEndpointPath, "/oauth2/token");
}

TEST(OptionsEnv, EmptyAuthorizationPathDisablesCodeGrant) {
    EnvGuard a("OIDC_AUTHORIZATION_ENDPOINT_PATH");
    ::setenv("OIDC_AUTHORIZATION_ENDPOINT_PATH", "", 1);
    auto o = LoadTokenEndpointOptionsFromEnv(TokenEndpointOptions{});
    EXPECT_TRUE(o.authorizationEndpointPath.empty());
}

TEST(OptionsEnv, EnvFlagParsing) {
    EnvGuard f("OIDC_TEST_FLAG");
    EXPECT_TRUE(GetEnvFlag("OIDC_TEST_FLAG", true));
    ::setenv("OIDC_TEST_FLAG", "1", 1);
    EXPECT_TRUE(GetEnvFlag("OIDC_TEST_FLAG", false));
    ::setenv("OIDC_TEST_FLAG", "no", 1);
    EXPECT_FALSE(GetEnvFlag("OIDC_TEST_FLAG", true));
}

TEST(OptionsEnv, LogLevelNames) {
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Error"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::LOG_DEBUG_LEVEL);
}

TEST(OptionsEnv, LoggerConfigureFromEnvAppliesLevel) {
    EnvGuard l("OIDC_LOG_LEVEL");
    EnvGuard f("OIDC_LOG_FILE");
    const LogLevel saved = Logger::sLogLevel;

    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::configureFromEnv();
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_INFO_LEVEL);

    ::setenv("OIDC_LOG_LEVEL", "error", 1);
    Logger::configureFromEnv();
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_ERROR_LEVEL);

    Logger::setLogLevel(saved);
}

TEST(OptionsEnv, LogMessagesUseStdFormat) {
    const std::string path = ::testing::TempDir() + "oidc_logger_format.log";
    std::remove(path.c_str());
    const LogLevel saved = Logger::sLogLevel;
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);
    Logger::setLogFile(path);

    LOG_INFO("issued {} tokens to [{:>6}]", 2, "abc");
    LOG_INFO("bad spec {:q}", 1);

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("issued 2 tokens to [   abc]"), std::string::npos);
    EXPECT_NE(contents.str().find("Format error:"), std::string::npos);

    Logger::setLogLevel(saved);
}
