#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

#include "fake_remote.hpp"
#include "sftp_local.hpp"
#include "sftp_transfer.hpp"

namespace fs = std::filesystem;

namespace {

/** PosixLocal with one-shot failures on open, write or close */
class FlakyLocal : public PosixLocal {
public:
	bool fail_open  = false;
	bool fail_write = false;
	bool fail_close = false;

	int32_t open(const std::string& path, uint8_t mode, LocalHandle_t* handle,
		ErrCause_t* err) override
	{
		if (fail_open) {
			fail_open = false;
			SftpErr::set_errno(err, EACCES);
			return -1;
		}

		return PosixLocal::open(path, mode, handle, err);
	}

	int32_t write(LocalHandle_t handle, const char* buf, size_t n,
		ErrCause_t* err) override
	{
		if (fail_write) {
			fail_write = false;
			SftpErr::set_errno(err, ENOSPC);
			return -1;
		}

		return PosixLocal::write(handle, buf, n, err);
	}

	int32_t close(LocalHandle_t handle, ErrCause_t* err) override
	{
		int32_t rc = PosixLocal::close(handle, err);
		if (rc || !fail_close) return rc;

		fail_close = false;
		SftpErr::set_errno(err, EIO);

		return -1;
	}
};

static std::string pattern(size_t n)
{
	std::string data(n, '\0');
	for (size_t i = 0; i < n; i++) data[i] = static_cast<char>((i * 31 + 7) % 251);

	return data;
}

}

class TransferTest : public ::testing::Test {
protected:
	fs::path       root;
	FakeRemote     remote;
	FlakyLocal     local;
	TransferOpts_t opts;
	ToolkitErr_t   err;

	void SetUp() override
	{
		root = fs::temp_directory_path()
			/ ("stk_xfer_" + std::to_string(::getpid()) + "_"
				+ ::testing::UnitTest::GetInstance()->current_test_info()->name());
		fs::remove_all(root);
		fs::create_directories(root);
	}

	void TearDown() override { fs::remove_all(root); }

	std::string p(const std::string& name) const { return (root / name).string(); }

	void write_local(const std::string& name, const std::string& data) const
	{
		std::ofstream out(root / name, std::ios::binary);
		out.write(data.data(), static_cast<std::streamsize>(data.size()));
	}

	std::string read_local(const std::string& name) const
	{
		std::ifstream in(root / name, std::ios::binary);
		return std::string(std::istreambuf_iterator<char>(in),
			std::istreambuf_iterator<char>());
	}
};

TEST_F(TransferTest, RoundTripIsByteIdentical)
{
	std::string data = pattern(65535);
	write_local("src", data);

	opts.chunk_size = 32768;

	ASSERT_EQ(SftpTransfer::upload_file(remote, local, p("src"), "r", opts, &err),
		0);
	EXPECT_EQ(remote.write_sizes, (std::vector<size_t> { 32768, 32767 }));
	EXPECT_EQ(remote.node("r").data, data);

	ASSERT_EQ(
		SftpTransfer::download_file(remote, local, "r", p("dst"), opts, &err), 0);
	EXPECT_EQ(read_local("dst"), data);
	EXPECT_EQ(remote.open_handles(), 0U);
}

TEST_F(TransferTest, ZeroChunkSizeSelectsDefault)
{
	write_local("src", pattern(40000));

	opts.chunk_size = 0;

	ASSERT_EQ(SftpTransfer::upload_file(remote, local, p("src"), "r", opts, &err),
		0);
	EXPECT_EQ(remote.write_sizes,
		(std::vector<size_t> { STK_DEFAULT_CHUNK_SIZE, 40000 - STK_DEFAULT_CHUNK_SIZE }));
}

TEST_F(TransferTest, EmptyFileTransfers)
{
	write_local("empty", "");

	ASSERT_EQ(
		SftpTransfer::upload_file(remote, local, p("empty"), "r", opts, &err), 0);
	ASSERT_TRUE(remote.exists("r"));
	EXPECT_TRUE(remote.node("r").data.empty());
	EXPECT_TRUE(remote.write_sizes.empty());

	ASSERT_EQ(
		SftpTransfer::download_file(remote, local, "r", p("back"), opts, &err), 0);
	ASSERT_TRUE(fs::exists(root / "back"));
	EXPECT_EQ(fs::file_size(root / "back"), 0U);
}

TEST_F(TransferTest, UploadTruncatesExistingRemote)
{
	remote.add_file("r", std::string(100, 'x'));
	write_local("src", "short");

	ASSERT_EQ(SftpTransfer::upload_file(remote, local, p("src"), "r", opts, &err),
		0);
	EXPECT_EQ(remote.node("r").data, "short");
}

TEST_F(TransferTest, DownloadOfMissingRemoteLeavesNoLocalFile)
{
	EXPECT_EQ(
		SftpTransfer::download_file(remote, local, "nope", p("dst"), opts, &err),
		-1);

	EXPECT_EQ(err.tag, ERR_TAG_REMOTE_OPEN);
	EXPECT_EQ(err.path, "nope");
	EXPECT_EQ(err.cause.msg, "no_such_file");
	EXPECT_FALSE(fs::exists(root / "dst"));
}

TEST_F(TransferTest, DownloadOfRemoteDirectoryFails)
{
	remote.add_dir("d");

	EXPECT_EQ(
		SftpTransfer::download_file(remote, local, "d", p("dst"), opts, &err), -1);

	EXPECT_EQ(err.tag, ERR_TAG_REMOTE_OPEN);
	EXPECT_FALSE(fs::exists(root / "dst"));
}

TEST_F(TransferTest, DownloadIntoLocalDirectoryFails)
{
	remote.add_file("r", "data");
	fs::create_directory(root / "dir");

	EXPECT_EQ(
		SftpTransfer::download_file(remote, local, "r", p("dir"), opts, &err), -1);

	EXPECT_EQ(err.tag, ERR_TAG_LOCAL_OPEN);
	EXPECT_EQ(err.path, p("dir"));
	EXPECT_EQ(err.cause.type, ERR_FROM_LOCAL);
	EXPECT_EQ(err.cause.msg, "eisdir");
	EXPECT_EQ(remote.count("open"), 0U);
}

TEST_F(TransferTest, UploadOfMissingLocalNeverTouchesRemote)
{
	remote.add_file("r", "keep");

	EXPECT_EQ(
		SftpTransfer::upload_file(remote, local, p("nope"), "r", opts, &err), -1);

	EXPECT_EQ(err.tag, ERR_TAG_LOCAL_OPEN);
	EXPECT_EQ(err.cause.code, ENOENT);
	EXPECT_EQ(err.cause.msg, "enoent");
	EXPECT_EQ(remote.count("open"), 0U);
	EXPECT_EQ(remote.node("r").data, "keep");
}

TEST_F(TransferTest, UploadOfUnreadableLocalNeverTouchesRemote)
{
	remote.add_file("r", "keep");
	write_local("src", "secret");
	local.fail_open = true;

	EXPECT_EQ(SftpTransfer::upload_file(remote, local, p("src"), "r", opts, &err),
		-1);

	EXPECT_EQ(err.tag, ERR_TAG_LOCAL_OPEN);
	EXPECT_EQ(err.path, p("src"));
	EXPECT_EQ(err.cause.code, EACCES);
	EXPECT_EQ(err.cause.msg, "eacces");
	EXPECT_EQ(remote.count("open"), 0U);
	EXPECT_EQ(remote.node("r").data, "keep");
}

TEST_F(TransferTest, UploadOfLocalDirectoryFails)
{
	fs::create_directory(root / "dir");

	EXPECT_EQ(
		SftpTransfer::upload_file(remote, local, p("dir"), "r", opts, &err), -1);

	EXPECT_EQ(err.tag, ERR_TAG_LOCAL_OPEN);
	EXPECT_EQ(err.cause.msg, "eisdir");
	EXPECT_FALSE(remote.exists("r"));
}

TEST_F(TransferTest, UploadIntoMissingRemoteDirectoryFails)
{
	write_local("src", "data");

	EXPECT_EQ(
		SftpTransfer::upload_file(remote, local, p("src"), "no/dir/r", opts, &err),
		-1);

	EXPECT_EQ(err.tag, ERR_TAG_REMOTE_OPEN);
	EXPECT_EQ(err.path, "no/dir/r");
	EXPECT_EQ(err.cause.msg, "no_such_file");
}

TEST_F(TransferTest, RemoteReadFailureIsTransferError)
{
	remote.add_file("r", pattern(1000));
	remote.fail_on("read", "r", STK_FX_CONNECTION_LOST);

	EXPECT_EQ(
		SftpTransfer::download_file(remote, local, "r", p("dst"), opts, &err), -1);

	EXPECT_EQ(err.tag, ERR_TAG_TRANSFER);
	EXPECT_EQ(err.direction, XFER_DOWNLOAD);
	EXPECT_EQ(err.side, XFER_SIDE_READ);
	EXPECT_EQ(err.path, "r");
	EXPECT_EQ(err.cause.msg, "connection_lost");
	EXPECT_EQ(remote.open_handles(), 0U);
}

TEST_F(TransferTest, LocalWriteFailureIsTransferError)
{
	remote.add_file("r", pattern(1000));
	local.fail_write = true;

	EXPECT_EQ(
		SftpTransfer::download_file(remote, local, "r", p("dst"), opts, &err), -1);

	EXPECT_EQ(err.tag, ERR_TAG_TRANSFER);
	EXPECT_EQ(err.direction, XFER_DOWNLOAD);
	EXPECT_EQ(err.side, XFER_SIDE_WRITE);
	EXPECT_EQ(err.path, p("dst"));
	EXPECT_EQ(err.cause.msg, "enospc");
	EXPECT_EQ(remote.open_handles(), 0U);
}

TEST_F(TransferTest, RemoteWriteFailureIsTransferError)
{
	write_local("src", pattern(1000));
	remote.fail_on("write", "r", STK_FX_NO_SPACE);

	EXPECT_EQ(SftpTransfer::upload_file(remote, local, p("src"), "r", opts, &err),
		-1);

	EXPECT_EQ(err.tag, ERR_TAG_TRANSFER);
	EXPECT_EQ(err.direction, XFER_UPLOAD);
	EXPECT_EQ(err.side, XFER_SIDE_WRITE);
	EXPECT_EQ(err.path, "r");
	EXPECT_EQ(err.cause.msg, "no_space_on_filesystem");
	EXPECT_EQ(SftpErr::format(err),
		"transfer/upload/write 'r': no_space_on_filesystem (14)");
	EXPECT_EQ(remote.open_handles(), 0U);
}

TEST_F(TransferTest, RemoteCloseFailureIsReported)
{
	remote.add_file("r", "data");
	remote.fail_on("close", "r", STK_FX_FAILURE);

	EXPECT_EQ(
		SftpTransfer::download_file(remote, local, "r", p("dst"), opts, &err), -1);

	EXPECT_EQ(err.tag, ERR_TAG_REMOTE_CLOSE);
	EXPECT_EQ(err.path, "r");
	EXPECT_EQ(read_local("dst"), "data");
}

TEST_F(TransferTest, LocalCloseFailureIsReported)
{
	write_local("src", "data");
	local.fail_close = true;

	EXPECT_EQ(SftpTransfer::upload_file(remote, local, p("src"), "r", opts, &err),
		-1);

	EXPECT_EQ(err.tag, ERR_TAG_LOCAL_CLOSE);
	EXPECT_EQ(err.path, p("src"));
	EXPECT_EQ(err.cause.msg, "eio");
	EXPECT_EQ(remote.open_handles(), 0U);
}
