#include "sftp_local.hpp"

#include "debug.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#if defined(_POSIX_VERSION) || defined(__unix__) || defined(__APPLE__)
#	include <sys/stat.h>
#	include <sys/types.h>
#	include <unistd.h>

#	define STK_RESET_ERRNO() errno = 0;
#elif defined(_WIN32)
#	include <io.h>       // _access
#	include <sys/stat.h> // file status

#	define stat          _stat
#	define lstat         _stat // no equivalent for windows, use _stat
#	define fstat         _fstat
#	define fileno        _fileno
#	define access(p, m)  _access((p), (m))
#	define R_OK          4
#	define W_OK          2
#	define S_ISDIR(mode) ((mode) & _S_IFDIR)
#	define S_ISREG(mode) ((mode) & _S_IFREG)
#	define STK_RESET_ERRNO() errno = 0;
#else
#	error "UNKNOWN ENVIRONMENT"
#endif

namespace {

static void conv_stat_info(EntryInfo_t* info, struct stat* st)
{
	info->type  = SftpLocal::get_filetype(static_cast<uint32_t>(st->st_mode));
	info->size  = static_cast<uint64_t>(st->st_size);
	info->perm  = static_cast<uint32_t>(st->st_mode) & 07777;
	info->uid   = static_cast<uint32_t>(st->st_uid);
	info->gid   = static_cast<uint32_t>(st->st_gid);
	info->atime = static_cast<uint64_t>(st->st_atime);
	info->mtime = static_cast<uint64_t>(st->st_mtime);
}

static FILE* prv_file(LocalHandle_t handle)
{
	return static_cast<FILE*>(handle);
}

}

uint8_t SftpLocal::get_filetype(uint32_t mode)
{
	if (S_ISREG(mode)) {
		return IS_REG_FILE;
	} else if (S_ISDIR(mode)) {
		return IS_DIR;
	}
#ifdef _POSIX_VERSION
	else if (S_ISLNK(mode)) {
		return IS_SYMLINK;
	} else if (S_ISCHR(mode)) {
		return IS_CHR_FILE;
	} else if (S_ISBLK(mode)) {
		return IS_BLK_FILE;
	} else if (S_ISFIFO(mode)) {
		return IS_PIPE;
	} else if (S_ISSOCK(mode)) {
		return IS_SOCK;
	}
#endif

	return IS_INVALID;
}

int32_t PosixLocal::open(const std::string& path, uint8_t mode,
	LocalHandle_t* handle, ErrCause_t* err)
{
	const char* fmode = (mode == LOCAL_OPEN_WRITE) ? "wb" : "rb";

	STK_RESET_ERRNO();
	FILE* fd = fopen(path.c_str(), fmode);

	if (!fd) {
		SftpErr::set_errno(err, errno);
		LOG_ERR("Unable to open local file '%s' [%d] %s\n", path.c_str(),
			err->code, err->msg.c_str());
		return -1;
	}

	/*
	 * NOTE: glibc happily opens a directory for reading and fails on the
	 *       first fread(). Report it here so it shows up as an open error.
	 * */
	if (mode == LOCAL_OPEN_READ) {
		struct stat st;

		if (fstat(fileno(fd), &st) == 0 && S_ISDIR(st.st_mode)) {
			fclose(fd);
			SftpErr::set_errno(err, EISDIR);
			LOG_ERR("Unable to open local file '%s': is a directory\n",
				path.c_str());
			return -1;
		}
	}

	*handle = static_cast<LocalHandle_t>(fd);

	return 0;
}

int64_t PosixLocal::read(
	LocalHandle_t handle, char* buf, size_t n, ErrCause_t* err)
{
	FILE* fd = prv_file(handle);

	STK_RESET_ERRNO();
	size_t nread = fread(buf, 1, n, fd);

	if (nread < n && ferror(fd)) {
		SftpErr::set_errno(err, errno ? errno : EIO);
		LOG_ERR("Failed reading local file [%d] %s\n", err->code,
			err->msg.c_str());
		return -1;
	}

	return static_cast<int64_t>(nread);
}

int32_t PosixLocal::write(
	LocalHandle_t handle, const char* buf, size_t n, ErrCause_t* err)
{
	FILE* fd = prv_file(handle);

	STK_RESET_ERRNO();
	if (fwrite(buf, 1, n, fd) != n) {
		SftpErr::set_errno(err, errno ? errno : EIO);
		LOG_ERR("Failed writing local file [%d] %s\n", err->code,
			err->msg.c_str());
		return -1;
	}

	return 0;
}

int32_t PosixLocal::close(LocalHandle_t handle, ErrCause_t* err)
{
	STK_RESET_ERRNO();

	// fclose also flushes, so a full disk may only show up here
	if (fclose(prv_file(handle))) {
		SftpErr::set_errno(err, errno ? errno : EIO);
		LOG_ERR("Failed closing local file [%d] %s\n", err->code,
			err->msg.c_str());
		return -1;
	}

	return 0;
}

int32_t PosixLocal::filestat(
	const std::string& path, EntryInfo_t* info, ErrCause_t* err)
{
	struct stat st;

	STK_RESET_ERRNO();
	if (lstat(path.c_str(), &st)) {
		SftpErr::set_errno(err, errno);
		return -1;
	}

	if (!info) return 0;

	conv_stat_info(info, &st);

	info->access = ACCESS_NONE;
	if (access(path.c_str(), R_OK) == 0) info->access |= ACCESS_READ;
	if (access(path.c_str(), W_OK) == 0) info->access |= ACCESS_WRITE;

	return 0;
}

int32_t PosixLocal::remove(const std::string& path, ErrCause_t* err)
{
	STK_RESET_ERRNO();
	if (::remove(path.c_str())) {
		SftpErr::set_errno(err, errno);
		LOG_ERR("Err %d: %s '%s'\n", err->code, err->msg.c_str(), path.c_str());
		return -1;
	}

	return 0;
}
