#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "sftp_local.hpp"

namespace fs = std::filesystem;

class PosixLocalTest : public ::testing::Test {
protected:
	fs::path   root;
	PosixLocal local;

	void SetUp() override
	{
		root = fs::temp_directory_path()
			/ ("stk_local_" + std::to_string(::getpid()) + "_"
				+ ::testing::UnitTest::GetInstance()->current_test_info()->name());
		fs::remove_all(root);
		fs::create_directories(root);
	}

	void TearDown() override { fs::remove_all(root); }

	std::string p(const std::string& name) const { return (root / name).string(); }
};

TEST_F(PosixLocalTest, WritesThenReadsBack)
{
	ErrCause_t    cause;
	LocalHandle_t fd = nullptr;

	ASSERT_EQ(local.open(p("f"), LOCAL_OPEN_WRITE, &fd, &cause), 0);
	ASSERT_EQ(local.write(fd, "hello", 5, &cause), 0);
	ASSERT_EQ(local.close(fd, &cause), 0);

	char buf[16];
	ASSERT_EQ(local.open(p("f"), LOCAL_OPEN_READ, &fd, &cause), 0);
	EXPECT_EQ(local.read(fd, buf, sizeof(buf), &cause), 5);
	EXPECT_EQ(local.read(fd, buf, sizeof(buf), &cause), 0);
	ASSERT_EQ(local.close(fd, &cause), 0);

	EXPECT_EQ(std::string(buf, 5), "hello");
}

TEST_F(PosixLocalTest, OpenMissingForReadIsEnoent)
{
	ErrCause_t    cause;
	LocalHandle_t fd = nullptr;

	EXPECT_EQ(local.open(p("missing"), LOCAL_OPEN_READ, &fd, &cause), -1);
	EXPECT_EQ(cause.type, ERR_FROM_LOCAL);
	EXPECT_EQ(cause.code, ENOENT);
	EXPECT_EQ(cause.msg, "enoent");
}

TEST_F(PosixLocalTest, OpenDirectoryIsEisdir)
{
	ErrCause_t    cause;
	LocalHandle_t fd = nullptr;

	fs::create_directory(root / "d");

	EXPECT_EQ(local.open(p("d"), LOCAL_OPEN_READ, &fd, &cause), -1);
	EXPECT_EQ(cause.msg, "eisdir");

	EXPECT_EQ(local.open(p("d"), LOCAL_OPEN_WRITE, &fd, &cause), -1);
	EXPECT_EQ(cause.msg, "eisdir");
}

TEST_F(PosixLocalTest, FilestatReportsTypeAndSize)
{
	ErrCause_t  cause;
	EntryInfo_t info;

	{
		std::ofstream out(root / "f", std::ios::binary);
		out << "abc";
	}

	ASSERT_EQ(local.filestat(p("f"), &info, &cause), 0);
	EXPECT_EQ(info.type, IS_REG_FILE);
	EXPECT_EQ(info.size, 3U);
	EXPECT_TRUE(STK_CAN_READ(info));

	ASSERT_EQ(local.filestat(p(""), &info, &cause), 0);
	EXPECT_EQ(info.type, IS_DIR);

	fs::create_symlink(root / "f", root / "l");
	ASSERT_EQ(local.filestat(p("l"), &info, &cause), 0);
	EXPECT_EQ(info.type, IS_SYMLINK);

	EXPECT_EQ(local.filestat(p("missing"), nullptr, &cause), -1);
	EXPECT_TRUE(SftpErr::is_not_found(cause));
}

TEST_F(PosixLocalTest, RemoveDeletesFile)
{
	ErrCause_t cause;

	std::ofstream(root / "f").put('x');

	ASSERT_EQ(local.remove(p("f"), &cause), 0);
	EXPECT_FALSE(fs::exists(root / "f"));

	EXPECT_EQ(local.remove(p("f"), &cause), -1);
	EXPECT_EQ(cause.code, ENOENT);
}
