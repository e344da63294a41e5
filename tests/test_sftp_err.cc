#include <gtest/gtest.h>

#include <cerrno>

#include "sftp_err.hpp"
#include "sftp_toolkit.hpp"

TEST(SftpErrTest, NamesSftpStatusCodes)
{
	ErrCause_t cause;

	SftpErr::set_sftp(&cause, STK_FX_NO_SUCH_FILE);
	EXPECT_EQ(cause.type, ERR_FROM_SFTP);
	EXPECT_EQ(cause.code, 2);
	EXPECT_EQ(cause.msg, "no_such_file");

	SftpErr::set_sftp(&cause, STK_FX_PERMISSION_DENIED);
	EXPECT_EQ(cause.msg, "permission_denied");

	SftpErr::set_sftp(&cause, 99);
	EXPECT_EQ(cause.msg, "sftp_status_99");
}

TEST(SftpErrTest, NamesSessionTimeout)
{
	ErrCause_t cause;

	SftpErr::set_session(&cause, STK_SESSION_TIMEOUT);
	EXPECT_EQ(cause.type, ERR_FROM_SESSION);
	EXPECT_EQ(cause.msg, "timeout");
}

TEST(SftpErrTest, NamesErrno)
{
	ErrCause_t cause;

	SftpErr::set_errno(&cause, EACCES);
	EXPECT_EQ(cause.type, ERR_FROM_LOCAL);
	EXPECT_EQ(cause.msg, "eacces");

	SftpErr::set_errno(&cause, EISDIR);
	EXPECT_EQ(cause.msg, "eisdir");
}

TEST(SftpErrTest, NotFoundCoversBothSides)
{
	ErrCause_t cause;

	SftpErr::set_sftp(&cause, STK_FX_NO_SUCH_FILE);
	EXPECT_TRUE(SftpErr::is_not_found(cause));

	SftpErr::set_sftp(&cause, STK_FX_NO_SUCH_PATH);
	EXPECT_TRUE(SftpErr::is_not_found(cause));

	SftpErr::set_errno(&cause, ENOENT);
	EXPECT_TRUE(SftpErr::is_not_found(cause));

	SftpErr::set_sftp(&cause, STK_FX_FAILURE);
	EXPECT_FALSE(SftpErr::is_not_found(cause));

	SftpErr::set_session(&cause, STK_SESSION_TIMEOUT);
	EXPECT_FALSE(SftpErr::is_not_found(cause));
}

TEST(SftpErrTest, FormatsTransferError)
{
	ToolkitErr_t err;

	err.tag       = ERR_TAG_TRANSFER;
	err.direction = XFER_UPLOAD;
	err.side      = XFER_SIDE_WRITE;
	err.path      = "remote/f";
	SftpErr::set_sftp(&err.cause, STK_FX_FAILURE);

	EXPECT_EQ(SftpErr::format(err), "transfer/upload/write 'remote/f': failure (4)");
}

TEST(SftpErrTest, FormatsInvalidTypeAndAccess)
{
	ToolkitErr_t err;

	err.tag       = ERR_TAG_INVALID_TYPE;
	err.path      = "a/b";
	err.file_type = IS_SYMLINK;
	EXPECT_EQ(SftpErr::format(err), "invalid_type 'a/b': symlink");

	SftpErr::clear(&err);
	err.tag    = ERR_TAG_INVALID_ACCESS;
	err.path   = "a";
	err.access = ACCESS_READ;
	EXPECT_EQ(SftpErr::format(err), "invalid_access 'a': read");
}

TEST(SftpErrTest, ClearResetsEverything)
{
	ToolkitErr_t err;

	err.tag  = ERR_TAG_DEL_DIR;
	err.path = "x";
	SftpErr::set_errno(&err.cause, EIO);

	SftpErr::clear(&err);

	EXPECT_EQ(err.tag, ERR_TAG_NONE);
	EXPECT_TRUE(err.path.empty());
	EXPECT_EQ(err.cause.type, ERR_FROM_NONE);
	EXPECT_EQ(SftpErr::format(err), "none");
}
