/*
 * Validator tests - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <ai-cmdgate/gate/validator.hpp>
#include <ai-cmdgate/policy/policy.hpp>

using namespace cmdgate;

static RejectReason reason_of(const ValidationOutcome& v) {
    auto r = rejection(v);
    EXPECT_NE(r, nullptr);
    return r ? r->reason : RejectReason::Empty;
}

static std::string detail_of(const ValidationOutcome& v) {
    auto r = rejection(v);
    return r ? r->detail : std::string();
}

// Default policy without the literal denylist, to reach the regex layer.
static Policy patterns_only() {
    Policy p = default_policy();
    p.forbidden_substrings.clear();
    return p;
}

TEST(ValidatorEmpty, EmptyAndBlank) {
    auto p = default_policy();
    EXPECT_EQ(reason_of(validate("", p)), RejectReason::Empty);
    EXPECT_EQ(reason_of(validate("   \t ", p)), RejectReason::Empty);
}

TEST(ValidatorLength, LongButBenignCommandRejected) {
    auto p = default_policy();
    p.max_command_length = 20;
    std::string cmd = "ls " + std::string(30, 'a');
    EXPECT_EQ(reason_of(validate(cmd, p)), RejectReason::TooLong);
    EXPECT_TRUE(is_accepted(validate("ls aaaa", p)));
    // exactly at the limit is fine
    std::string edge = "ls " + std::string(17, 'b');
    ASSERT_EQ(edge.size(), 20u);
    EXPECT_TRUE(is_accepted(validate(edge, p)));
}

TEST(ValidatorForbidden, CaseInsensitiveAndBeforeAllowlist) {
    auto p = default_policy();
    auto v = validate("ls; SHUTDOWN -h now", p);
    EXPECT_EQ(reason_of(v), RejectReason::ForbiddenSubstring);
    EXPECT_EQ(detail_of(v), "shutdown");
    // not allowlisted program, still reported as forbidden substring
    EXPECT_EQ(reason_of(validate("python3 -c 'reboot'", p)), RejectReason::ForbiddenSubstring);
    // embedded in a compound command
    EXPECT_EQ(reason_of(validate("cat a && rm -rf / ", p)), RejectReason::ForbiddenSubstring);
}

TEST(ValidatorForbidden, AllowlistedProgramsCannotCarryForbiddenText) {
    auto p = default_policy();
    for (const char* cmd : {"git init", "ls | killall x", "cat x; mkfs.ext4 /dev/sdb"}) {
        EXPECT_EQ(reason_of(validate(cmd, p)), RejectReason::ForbiddenSubstring) << cmd;
    }
}

TEST(ValidatorPatterns, RecursiveRootDelete) {
    auto v = validate("rm -rf /", patterns_only());
    EXPECT_EQ(reason_of(v), RejectReason::DangerousPattern);
    EXPECT_EQ(detail_of(v), "rm-rf-root");
}

TEST(ValidatorPatterns, RawDiskWriteAndDeviceRedirects) {
    auto p = patterns_only();
    EXPECT_EQ(detail_of(validate("dd if=/dev/zero of=/dev/sda bs=1M", p)), "dd-to-device");
    EXPECT_EQ(detail_of(validate("cat x > /dev/sda", p)), "redirect-to-dev");
    EXPECT_EQ(detail_of(validate("cat x | tee /dev/sda", p)), "tee-to-dev");
    EXPECT_EQ(detail_of(validate("ls; REBOOT now", p)), "reboot");
}

TEST(ValidatorPatterns, FirstMatchingPatternInListOrder) {
    // ">>" also contains "> /dev/", which comes first in the list
    auto p = patterns_only();
    EXPECT_EQ(detail_of(validate("cat x >> /dev/null", p)), "redirect-to-dev");

    Policy custom = p;
    custom.dangerous_patterns.clear();
    custom.dangerous_patterns.push_back(*make_pattern("never", "zzz-not-present"));
    custom.dangerous_patterns.push_back(*make_pattern("append", R"(>>\s*/dev/)"));
    EXPECT_EQ(detail_of(validate("cat x >> /dev/null", custom)), "append");
}

TEST(ValidatorAllowlist, UnknownLeadingProgram) {
    auto p = default_policy();
    for (const char* cmd : {"python3 script.py", "curl http://example.com", "/bin/ls", "sudo ls", "FOO=1 ls"}) {
        auto v = validate(cmd, p);
        EXPECT_EQ(reason_of(v), RejectReason::CommandNotAllowlisted) << cmd;
    }
    EXPECT_EQ(detail_of(validate("python3 script.py", p)), "python3");
    EXPECT_EQ(detail_of(validate("FOO=1 ls", p)), "FOO=1");
}

TEST(ValidatorAllowlist, EveryCommandPositionChecked) {
    auto p = default_policy();
    EXPECT_EQ(detail_of(validate("ls && whoami", p)), "whoami");
    EXPECT_EQ(detail_of(validate("ls | sort", p)), "sort");
    EXPECT_EQ(detail_of(validate("ls; (cat a; nc -l 9999)", p)), "nc");
    EXPECT_EQ(detail_of(validate("; ls", p)), ";");
    EXPECT_EQ(detail_of(validate("ls\nwhoami", p)), "whoami");
    EXPECT_EQ(detail_of(validate("ls /tmp\n\n  id -u", p)), "id");
    EXPECT_TRUE(is_accepted(validate("ls |\n grep cpp\npwd\n", p)));
    EXPECT_TRUE(is_accepted(validate("ls -la | grep cpp && pwd", p)));
}

TEST(ValidatorAllowlist, SubstitutionsAndRedirectionsChecked) {
    auto p = default_policy();
    EXPECT_EQ(detail_of(validate("ls $(python3 x.py)", p)), "python3");
    EXPECT_EQ(detail_of(validate("cat \"`whoami`\"", p)), "whoami");
    EXPECT_EQ(detail_of(validate("cat a > $(nc -l 1)", p)), "nc");
    EXPECT_EQ(detail_of(validate("cat <(curl x)", p)), "curl");
    EXPECT_TRUE(is_accepted(validate("ls $(pwd) 2>&1", p)));
    EXPECT_TRUE(is_accepted(validate("cat '$(nc -l 1)'", p)));
    EXPECT_TRUE(is_accepted(validate("> out.txt ls", p)));
    EXPECT_EQ(reason_of(validate("ls $(pwd", p)), RejectReason::Unparseable);
    EXPECT_EQ(reason_of(validate("> out.txt", p)), RejectReason::Unparseable);
}

TEST(ValidatorAllowlist, EmptyAllowlistPermitsNothing) {
    Policy p;
    EXPECT_EQ(reason_of(validate("ls", p)), RejectReason::CommandNotAllowlisted);
}

TEST(ValidatorParse, UnbalancedQuotes) {
    auto p = default_policy();
    EXPECT_EQ(reason_of(validate("ls 'foo", p)), RejectReason::Unparseable);
    EXPECT_EQ(reason_of(validate("cat \"a b", p)), RejectReason::Unparseable);
}

TEST(ValidatorAccept, OriginalCommandReturned) {
    auto p = default_policy();
    auto v = validate("ls -la", p);
    ASSERT_TRUE(is_accepted(v));
    EXPECT_EQ(std::get<Accepted>(v).command, "ls -la");

    // redirect target is not a program; sanitization happens later
    auto w = validate("cat secret > /etc/passwd", p);
    ASSERT_TRUE(is_accepted(w));
    EXPECT_EQ(std::get<Accepted>(w).command, "cat secret > /etc/passwd");

    EXPECT_TRUE(is_accepted(validate("'ls' \"-l\"", p)));
}

TEST(ValidatorWords, CommandPositions) {
    bool bad = false;
    auto words = command_words("cat a > b | grep x 2>err && ls", &bad);
    EXPECT_FALSE(bad);
    std::vector<std::string> expected = {"cat", "grep", "ls"};
    EXPECT_EQ(words, expected);
    command_words("echo 'x", &bad);
    EXPECT_TRUE(bad);
    std::string nested = "ls";
    for (int i = 0; i < 12; ++i) nested = "ls $(" + nested + ")";
    EXPECT_TRUE(command_words(nested, &bad).empty());
    EXPECT_TRUE(bad);
}
