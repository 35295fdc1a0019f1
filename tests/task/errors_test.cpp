#include "shareup/task/errors.hpp"

#include <gtest/gtest.h>

#include <string>

using shareup::task::UploadError;
using shareup::task::is_retryable;

TEST(UploadErrorTest, TransientStagesAreRetryable) {
    EXPECT_TRUE(is_retryable(UploadError::ConnectionFailed));
    EXPECT_TRUE(is_retryable(UploadError::UploadFailed));

    EXPECT_FALSE(is_retryable(UploadError::Cancelled));
    EXPECT_FALSE(is_retryable(UploadError::FileNotFound));
    EXPECT_FALSE(is_retryable(UploadError::ServerNotFound));
    EXPECT_FALSE(is_retryable(UploadError::DirectoryDownloaded));
}

TEST(UploadErrorTest, NamesErrors) {
    EXPECT_EQ(std::string(to_string(UploadError::Cancelled)), "cancelled");
    EXPECT_EQ(std::string(to_string(UploadError::DirectoryDownloaded)), "target is a directory");
}
