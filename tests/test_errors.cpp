#include <gtest/gtest.h>
#include <clusterlink/core/errors.hpp>
#include <clusterlink/core/types.hpp>

using namespace clusterlink;

TEST(Errors, DefaultCodes) {
    EXPECT_EQ(make_error(ErrorKind::Network, "x").code, "NET_001");
    EXPECT_EQ(make_error(ErrorKind::Timeout, "x").code, "NET_002");
    EXPECT_EQ(make_error(ErrorKind::Authentication, "x").code, "AUTH_001");
    EXPECT_EQ(make_error(ErrorKind::Permission, "x").code, "PERM_001");
    EXPECT_EQ(make_error(ErrorKind::FileSystem, "x").code, "FILE_001");
    EXPECT_EQ(make_error(ErrorKind::Protocol, "x").code, "PROTO_001");
    EXPECT_EQ(make_error(ErrorKind::Validation, "x").code, "VAL_001");
    EXPECT_EQ(make_error(ErrorKind::Internal, "x").code, "INT_001");
    EXPECT_EQ(make_error(ErrorKind::Protocol, "x", "SLURM_001").code, "SLURM_001");
}

TEST(Errors, Retryable) {
    EXPECT_TRUE(make_error(ErrorKind::Network, "x").retryable());
    EXPECT_TRUE(make_error(ErrorKind::Timeout, "x").retryable());
    EXPECT_FALSE(make_error(ErrorKind::Authentication, "x").retryable());
    EXPECT_FALSE(make_error(ErrorKind::Permission, "x").retryable());
    EXPECT_FALSE(make_error(ErrorKind::Protocol, "x").retryable());
    EXPECT_FALSE(make_error(ErrorKind::Validation, "x").retryable());
}

TEST(Errors, ToString) {
    EXPECT_EQ(make_error(ErrorKind::Network, "connection refused").to_string(),
              "Network error: connection refused");
}

TEST(Errors, ClassifyMessage) {
    EXPECT_EQ(classify_message("ssh: connect timed out").kind, ErrorKind::Timeout);
    EXPECT_EQ(classify_message("Permission denied (publickey)").kind, ErrorKind::Permission);
    EXPECT_EQ(classify_message("mkdir: cannot create directory: No such file or directory").kind,
              ErrorKind::FileSystem);
    EXPECT_EQ(classify_message("Connection refused").kind, ErrorKind::Network);
    EXPECT_EQ(classify_message("Authentication failed").kind, ErrorKind::Authentication);

    Error other = classify_message("segfault in module");
    EXPECT_EQ(other.kind, ErrorKind::Internal);
    EXPECT_EQ(other.code, "CMD_001");
}

TEST(Errors, SuggestionPerCode) {
    EXPECT_NE(suggestion(make_error(ErrorKind::Network, "x")),
              suggestion(make_error(ErrorKind::Authentication, "x")));
    EXPECT_FALSE(suggestion(make_error(ErrorKind::Protocol, "x", "SLURM_002")).empty());
    EXPECT_FALSE(suggestion(make_error(ErrorKind::Internal, "x", "NOPE")).empty());
}

TEST(Errors, ResultOkErr) {
    auto ok = Result<int>::Ok(5);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value, 5);

    auto err = Result<int>::Err(ErrorKind::Validation, "bad");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error.message, "bad");

    EXPECT_TRUE(Result<void>::Ok().is_ok());
}

TEST(Errors, RemoteCommandResult) {
    RemoteCommandResult r;
    r.exit_code = 1;
    r.stderr_data = "boom";
    EXPECT_TRUE(r.failed());
    EXPECT_EQ(r.get_output(), "boom");
    r.stdout_data = "out";
    EXPECT_EQ(r.get_output(), "out");
}
