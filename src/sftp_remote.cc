#include <libssh2.h>
#include <libssh2_sftp.h>

#if defined(_WIN32)
#	include <winsock2.h> // sockets, basic networking
#	include <ws2tcpip.h> // getaddrinfo, inet_pton, etc.
#	include <windows.h>

#	define poll   WSAPoll
#	define pollfd WSAPOLLFD

#	define SHUT_RDWR SD_BOTH
#else
#	include <netdb.h>
#	include <sys/socket.h>
#	include <netinet/in.h>
#	include <arpa/inet.h>
#	include <unistd.h>
#	include <poll.h>
#endif

#include "debug.hpp"
#include "sftp_err.hpp"
#include "sftp_remote.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <string>

#define FN_RC_EAGAIN(rc, fn)   (((rc) = (fn)) == LIBSSH2_ERROR_EAGAIN)
#define FN_ACTUAL_ERROR(err)   ((err) != LIBSSH2_ERROR_EAGAIN)
#define FN_LAST_ERRNO_ERROR(s) FN_ACTUAL_ERROR(libssh2_session_last_errno(s))

/*
 * Call fn until it stops returning EAGAIN. In between, wait for the socket
 * but never past deadline, in which case rc becomes LIBSSH2_ERROR_TIMEOUT.
 * */
#define WAIT_EAGAIN(conn, rc, fn, deadline)                                    \
	do {                                                                       \
		if (!FN_RC_EAGAIN(rc, fn)) break;                                      \
		if (waitsocket((conn), (deadline)) <= 0) {                             \
			(rc) = LIBSSH2_ERROR_TIMEOUT;                                      \
			break;                                                             \
		}                                                                      \
	} while (1)

#if LOG_LEVEL >= 3
#	define LOG_DBG_FINGERPRINT(fp)                                            \
		do {                                                                   \
			LOG_DBG("Fingerprint ");                                           \
			for (uint8_t fp_byte : fp) fprintf(stdout, ":%02X", fp_byte);      \
			fprintf(stdout, "\n");                                             \
		} while (0)
#else
#	define LOG_DBG_FINGERPRINT(fp) ((void)fp)
#endif

namespace { // start of unnamed namespace for static function

typedef std::chrono::steady_clock::time_point Deadline_t;

static bool is_inited = false; /**< Whether libssh2 is initialized or not */

static Deadline_t prv_deadline(uint32_t timeout_ms)
{
	return std::chrono::steady_clock::now()
		+ std::chrono::milliseconds(timeout_ms);
}

/**
 * @brief wait until the socket is ready in the direction libssh2 is blocked.
 * @return positive when ready, 0 when the deadline passed, negative on error
 * */
static int32_t waitsocket(SftpConn_t* conn, Deadline_t deadline)
{
	auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
		deadline - std::chrono::steady_clock::now());

	if (remaining.count() <= 0) return 0;

	struct pollfd pfd = {};
	pfd.fd            = conn->sock;

	int32_t dir = libssh2_session_block_directions(conn->session);

	if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) pfd.events |= POLLIN;

	if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) pfd.events |= POLLOUT;

	// since we only have 1 fd, harcode the size
	return poll(&pfd, 1, static_cast<int>(remaining.count()));
}

/** fill cause, telling our own deadline apart from libssh2 errors */
static void prv_set_error(SftpConn_t* conn, int32_t rc, ErrCause_t* cause)
{
	if (rc == LIBSSH2_ERROR_TIMEOUT) {
		SftpErr::set_session(cause, LIBSSH2_ERROR_TIMEOUT);
		conn->last_error = *cause;
		return;
	}

	SftpRemote::set_error(conn, cause);
}

static LIBSSH2_SFTP_HANDLE* prv_handle(RemoteHandle_t handle)
{
	return static_cast<LIBSSH2_SFTP_HANDLE*>(handle);
}

static void kbd_callback(const char* name, int name_len,
	const char* instruction, int instruction_len, int num_prompts,
	const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
	LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
{
	(void)name;
	(void)name_len;
	(void)instruction;
	(void)instruction_len;
	(void)prompts;

	// only expects 1 prompt, which is the password for user
	if (num_prompts != 1) return;

	SftpConn_t* conn = static_cast<SftpConn_t*>(*abstract);

	responses[0].text   = strdup(conn->password.c_str());
	responses[0].length = conn->password.size();
}

static int32_t prv_auth_password(SftpConn_t* conn, Deadline_t deadline)
{
	int32_t rc = LIBSSH2_ERROR_EAGAIN;

	if (conn->use_keyboard) {
		WAIT_EAGAIN(conn, rc,
			libssh2_userauth_keyboard_interactive_ex(conn->session,
				conn->username.c_str(), conn->username.size(), &kbd_callback),
			deadline);
	} else {
		WAIT_EAGAIN(conn, rc,
			libssh2_userauth_password(
				conn->session, conn->username.c_str(), conn->password.c_str()),
			deadline);
	}

	return rc;
}

/**
 * Open a file or a directory, libssh2 signals a pending request by returning
 * NULL with EAGAIN as the session errno.
 * */
static LIBSSH2_SFTP_HANDLE* prv_open(SftpConn_t* conn, const std::string& path,
	unsigned long flags, long mode, int open_type, Deadline_t deadline,
	int32_t* rc)
{
	LIBSSH2_SFTP_HANDLE* handle = NULL;

	*rc = 0;

	do {
		handle = libssh2_sftp_open_ex(conn->sftp_session, path.c_str(),
			static_cast<unsigned int>(path.size()), flags, mode, open_type);

		if (handle) break;

		if (FN_LAST_ERRNO_ERROR(conn->session)) {
			*rc = libssh2_session_last_errno(conn->session);
			break;
		}

		if (waitsocket(conn, deadline) <= 0) {
			*rc = LIBSSH2_ERROR_TIMEOUT;
			break;
		}
	} while (!handle);

	return handle;
}

} // end of unnamed namespace for static function

void SftpRemote::set_error(SftpConn_t* conn, ErrCause_t* cause)
{
	int32_t sess_code = conn->session
		? libssh2_session_last_errno(conn->session)
		: LIBSSH2_ERROR_NONE;

	if (sess_code == LIBSSH2_ERROR_SFTP_PROTOCOL && conn->sftp_session) {
		SftpErr::set_sftp(cause,
			static_cast<int32_t>(libssh2_sftp_last_error(conn->sftp_session)));
	} else if (sess_code != LIBSSH2_ERROR_NONE) {
		SftpErr::set_session(cause, sess_code);
	} else {
		SftpErr::set_custom(cause, -1, "unknown");
	}

	conn->last_error = *cause;
}

uint8_t SftpRemote::get_filetype(const LIBSSH2_SFTP_ATTRIBUTES& attrs)
{
	if (!(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) return IS_INVALID;

	if (LIBSSH2_SFTP_S_ISREG(attrs.permissions)) {
		return IS_REG_FILE;
	} else if (LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
		return IS_DIR;
	} else if (LIBSSH2_SFTP_S_ISLNK(attrs.permissions)) {
		return IS_SYMLINK;
	} else if (LIBSSH2_SFTP_S_ISCHR(attrs.permissions)) {
		return IS_CHR_FILE;
	} else if (LIBSSH2_SFTP_S_ISBLK(attrs.permissions)) {
		return IS_BLK_FILE;
	} else if (LIBSSH2_SFTP_S_ISFIFO(attrs.permissions)) {
		return IS_PIPE;
	} else if (LIBSSH2_SFTP_S_ISSOCK(attrs.permissions)) {
		return IS_SOCK;
	} else {
		return IS_INVALID;
	}
}

/*
 * SFTP v3 does not tell which access the logged in user has. Like most
 * clients, owner permission bits are taken as the granted access.
 * */
uint8_t SftpRemote::get_access(const LIBSSH2_SFTP_ATTRIBUTES& attrs)
{
	if (!(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) return ACCESS_NONE;

	uint8_t access = ACCESS_NONE;

	if (attrs.permissions & LIBSSH2_SFTP_S_IRUSR) access |= ACCESS_READ;
	if (attrs.permissions & LIBSSH2_SFTP_S_IWUSR) access |= ACCESS_WRITE;

	return access;
}

int32_t SftpRemote::connect(SftpConn_t* conn)
{
	if (conn->status >= STK_CONNECTED) return 0;

	int32_t rc;

	if (!is_inited) {
#ifdef _WIN32
		WSADATA wsadata;

		rc = WSAStartup(MAKEWORD(2, 0), &wsadata);
		if (rc) {
			SftpErr::set_custom(&conn->last_error, rc, "WSAStartup failed");
			LOG_ERR("WSAStartup failed %d\n", rc);
			return 1;
		}
#endif
		if ((rc = libssh2_init(0)) != 0) {
			SftpErr::set_custom(
				&conn->last_error, rc, "libssh2 initialization failed");
			LOG_ERR("libssh2 initialization failed (%d)\n", rc);
			return -127;
		}

		is_inited = true;
	}

	struct addrinfo  hints;
	struct addrinfo* res = NULL;

	memset(&hints, 0, sizeof(hints));

	hints.ai_family   = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	errno = 0;
	rc    = getaddrinfo(
        conn->host.c_str(), std::to_string(conn->port).c_str(), &hints, &res);
	if (rc != 0 || !res) {
		SftpErr::set_custom(&conn->last_error, rc, gai_strerror(rc));
		LOG_ERR("FAILED getaddrinfo '%s' %d\n", conn->host.c_str(), rc);
		if (res) freeaddrinfo(res);

		return -1;
	}

	errno      = 0;
	conn->sock = socket(res->ai_family, res->ai_socktype, 0);
	if (conn->sock == LIBSSH2_INVALID_SOCKET) {
		freeaddrinfo(res);

		SftpErr::set_errno(&conn->last_error, errno);
		LOG_ERR("failed to create socket.\n");

		return -1;
	}

	errno = 0;
	if ((rc = ::connect(conn->sock, res->ai_addr, res->ai_addrlen))) {
		freeaddrinfo(res);

		SftpErr::set_errno(&conn->last_error, errno);
		LOG_ERR("failed to connect. (%d) [%s:%u]\n", rc, conn->host.c_str(),
			conn->port);

		LIBSSH2_SOCKET_CLOSE(conn->sock);
		conn->sock = LIBSSH2_INVALID_SOCKET;

		return rc;
	}

	// NOTE: always forgot this. FREE getaddrinfo res AFTER USE
	freeaddrinfo(res);

	/*
	 * Create a session instance using extended API to set SftpConn_t as
	 * abstract. This way the keyboard-interactive callback can reach the
	 * password.
	 * */
	conn->session = libssh2_session_init_ex(NULL, NULL, NULL, conn);
	if (!conn->session) {
		SftpErr::set_custom(
			&conn->last_error, -1, "could not initialize SSH session");
		LOG_ERR("Could not initialize SSH session.\n");
		return -1;
	}

	/* requests wait on the socket themselves, see WAIT_EAGAIN */
	libssh2_session_set_blocking(conn->session, 0);
	libssh2_session_flag(conn->session, LIBSSH2_FLAG_COMPRESS, 1);

	Deadline_t deadline = prv_deadline(STK_SEC2MS(conn->timeout_sec));

	WAIT_EAGAIN(conn, rc, libssh2_session_handshake(conn->session, conn->sock),
		deadline);

	if (rc) {
		prv_set_error(conn, rc, &conn->last_error);
		LOG_ERR("Failure establishing SSH session: %d\n", rc);
		return -1;
	}

	const char* fp;
	if ((fp = libssh2_hostkey_hash(conn->session, STK_HOSTKEY_HASH))) {
		conn->fingerprint = std::vector<uint8_t>(fp, fp + STK_FINGERPRINT_LEN);
		LOG_DBG_FINGERPRINT(conn->fingerprint);
	}

	conn->status = STK_CONNECTED;

	return 0;
}

int32_t SftpRemote::auth(SftpConn_t* conn)
{
	if (conn->status >= STK_AUTHENTICATED) return 0;

	int32_t    rc;
	Deadline_t deadline = prv_deadline(STK_SEC2MS(conn->timeout_sec));

	/*
	 * Authentication will prioritize pubkey over password.
	 * A valid pubkey auth needs both pubkey and privkey to be not empty, the
	 * password is then used as passphrase of the private key.
	 *
	 * `valid = (!pubkey.empty() && !privkey.empty()) || !password.empty()`
	 * */

	if (!conn->pubkey.empty() && !conn->privkey.empty()) {
		WAIT_EAGAIN(conn, rc,
			libssh2_userauth_publickey_fromfile(conn->session,
				conn->username.c_str(), conn->pubkey.c_str(),
				conn->privkey.c_str(), conn->password.c_str()),
			deadline);

		if (rc) {
			prv_set_error(conn, rc, &conn->last_error);
			LOG_ERR("Authentication by public key failed %d [%s].\n", rc,
				conn->username.c_str());
			return -1;
		}
	} else if (!conn->password.empty()) {
		rc = prv_auth_password(conn, deadline);
		if (rc) {
			prv_set_error(conn, rc, &conn->last_error);
			LOG_ERR("Authentication by password failed %d [%s].\n", rc,
				conn->username.c_str());
			return -1;
		}
	} else {
		SftpErr::set_custom(
			&conn->last_error, -80, "No Valid Authentication is provided");
		LOG_ERR("No Valid Authentication is provided.\n");
		return -2;
	}

	do {
		conn->sftp_session = libssh2_sftp_init(conn->session);

		if (conn->sftp_session) break;

		if (FN_LAST_ERRNO_ERROR(conn->session)) {
			SftpRemote::set_error(conn, &conn->last_error);
			LOG_ERR("Unable to init SFTP session\n");
			return -3;
		}

		if (waitsocket(conn, deadline) <= 0) {
			prv_set_error(conn, LIBSSH2_ERROR_TIMEOUT, &conn->last_error);
			LOG_ERR("Timed out initializing SFTP session\n");
			return -3;
		}
	} while (!conn->sftp_session);

	conn->status = STK_AUTHENTICATED;

	return 0;
}

void SftpRemote::disconnect(SftpConn_t* conn)
{
	if (conn->status == STK_DISCONNECTED && !conn->session
		&& conn->sock == LIBSSH2_INVALID_SOCKET)
		return;

	int32_t    rc       = 0;
	Deadline_t deadline = prv_deadline(STK_SEC2MS(conn->timeout_sec));

	if (conn->sftp_session) {
		WAIT_EAGAIN(conn, rc, libssh2_sftp_shutdown(conn->sftp_session),
			deadline);
		conn->sftp_session = nullptr;
	}

	if (conn->session) {
		WAIT_EAGAIN(conn, rc,
			libssh2_session_disconnect(conn->session, "normal"), deadline);
		WAIT_EAGAIN(conn, rc, libssh2_session_free(conn->session), deadline);
		conn->session = nullptr;
	}

	if (conn->sock != LIBSSH2_INVALID_SOCKET) {
		// NOTE: this is how to prevent name conflict with extern "C"
		::shutdown(conn->sock, SHUT_RDWR);
		LIBSSH2_SOCKET_CLOSE(conn->sock);
		conn->sock = LIBSSH2_INVALID_SOCKET;
	}

	conn->status = STK_DISCONNECTED;
}

void SftpRemote::shutdown()
{
	libssh2_exit();

#ifdef _WIN32
	WSACleanup();
#endif

	is_inited = false;
}

/* ************************ SftpChannel ************************************* */

SftpChannel::SftpChannel(SftpConn_t* conn)
	: conn(conn)
{
}

int32_t SftpChannel::stat(const std::string& path, EntryInfo_t* info,
	uint32_t timeout_ms, ErrCause_t* err)
{
	int32_t                 rc = 0;
	LIBSSH2_SFTP_ATTRIBUTES attrs;

	memset(&attrs, 0, sizeof(attrs));

	WAIT_EAGAIN(conn, rc,
		libssh2_sftp_stat_ex(conn->sftp_session, path.c_str(),
			static_cast<unsigned int>(path.size()), LIBSSH2_SFTP_LSTAT,
			&attrs),
		prv_deadline(timeout_ms));

	if (rc) {
		prv_set_error(conn, rc, err);
		return -1;
	}

	info->type   = SftpRemote::get_filetype(attrs);
	info->access = SftpRemote::get_access(attrs);
	info->perm   = static_cast<uint32_t>(attrs.permissions & 07777);

	if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) info->size = attrs.filesize;

	if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
		info->uid = static_cast<uint32_t>(attrs.uid);
		info->gid = static_cast<uint32_t>(attrs.gid);
	}

	if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
		info->atime = attrs.atime;
		info->mtime = attrs.mtime;
	}

	return 0;
}

int32_t SftpChannel::list(const std::string& path,
	std::vector<std::string>* names, uint32_t timeout_ms, ErrCause_t* err)
{
	int32_t    rc       = 0;
	Deadline_t deadline = prv_deadline(timeout_ms);

	LIBSSH2_SFTP_HANDLE* handle = prv_open(
		conn, path, 0, 0, LIBSSH2_SFTP_OPENDIR, deadline, &rc);

	if (!handle) {
		prv_set_error(conn, rc, err);
		LOG_ERR("Unable to open remote dir '%s': %s\n", path.c_str(),
			err->msg.c_str());
		return -1;
	}

	names->clear();

	/*
	 * read the opened directory, the whole listing shares one deadline as it
	 * is a single list request for the caller
	 * */
	while (1) {
		char                    filename[SFTP_FILENAME_MAX_LEN];
		LIBSSH2_SFTP_ATTRIBUTES attrs;

		WAIT_EAGAIN(conn, rc,
			libssh2_sftp_readdir(handle, filename, sizeof(filename), &attrs),
			deadline);

		// read dir is finished or failed
		if (rc <= 0) break;

		names->push_back(std::string(filename, static_cast<size_t>(rc)));
	}

	if (rc < 0) {
		prv_set_error(conn, rc, err);

		int32_t close_rc = 0;
		WAIT_EAGAIN(conn, close_rc, libssh2_sftp_closedir(handle),
			prv_deadline(timeout_ms));
		if (close_rc) LOG_WRN("Unable to close remote dir '%s'\n", path.c_str());

		return -1;
	}

	WAIT_EAGAIN(conn, rc, libssh2_sftp_closedir(handle), deadline);

	if (rc) {
		prv_set_error(conn, rc, err);
		return -1;
	}

	return 0;
}

int32_t SftpChannel::mkdir(
	const std::string& path, uint32_t timeout_ms, ErrCause_t* err)
{
	int32_t rc = 0;

	WAIT_EAGAIN(conn, rc,
		libssh2_sftp_mkdir_ex(conn->sftp_session, path.c_str(),
			static_cast<unsigned int>(path.size()), STK_REMOTE_DIR_MODE),
		prv_deadline(timeout_ms));

	if (rc) {
		prv_set_error(conn, rc, err);
		return -1;
	}

	return 0;
}

int32_t SftpChannel::remove_file(
	const std::string& path, uint32_t timeout_ms, ErrCause_t* err)
{
	int32_t rc = 0;

	WAIT_EAGAIN(conn, rc,
		libssh2_sftp_unlink_ex(conn->sftp_session, path.c_str(),
			static_cast<unsigned int>(path.size())),
		prv_deadline(timeout_ms));

	if (rc) {
		prv_set_error(conn, rc, err);
		return -1;
	}

	return 0;
}

int32_t SftpChannel::remove_dir(
	const std::string& path, uint32_t timeout_ms, ErrCause_t* err)
{
	int32_t rc = 0;

	WAIT_EAGAIN(conn, rc,
		libssh2_sftp_rmdir_ex(conn->sftp_session, path.c_str(),
			static_cast<unsigned int>(path.size())),
		prv_deadline(timeout_ms));

	if (rc) {
		prv_set_error(conn, rc, err);
		return -1;
	}

	return 0;
}

int32_t SftpChannel::open(const std::string& path, uint8_t mode,
	RemoteHandle_t* handle, uint32_t timeout_ms, ErrCause_t* err)
{
	int32_t       rc       = 0;
	Deadline_t    deadline = prv_deadline(timeout_ms);
	unsigned long flags    = (mode == REMOTE_OPEN_WRITE)
		   ? (LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC)
		   : LIBSSH2_FXF_READ;

	LIBSSH2_SFTP_HANDLE* fh = prv_open(
		conn, path, flags, STK_REMOTE_FILE_MODE, LIBSSH2_SFTP_OPENFILE,
		deadline, &rc);

	if (!fh) {
		prv_set_error(conn, rc, err);
		LOG_ERR("Unable to open remote file '%s': %s\n", path.c_str(),
			err->msg.c_str());
		return -1;
	}

	/*
	 * NOTE: OpenSSH happily opens a directory for reading and only fails on
	 *       the first read. Refuse it here, as the other servers do.
	 * */
	if (mode == REMOTE_OPEN_READ) {
		LIBSSH2_SFTP_ATTRIBUTES attrs;
		memset(&attrs, 0, sizeof(attrs));

		WAIT_EAGAIN(conn, rc, libssh2_sftp_fstat_ex(fh, &attrs, 0), deadline);

		if (rc == 0 && SftpRemote::get_filetype(attrs) == IS_DIR) {
			int32_t close_rc = 0;
			WAIT_EAGAIN(conn, close_rc, libssh2_sftp_close_handle(fh),
				prv_deadline(timeout_ms));
			if (close_rc) LOG_WRN("Unable to close '%s'\n", path.c_str());

			SftpErr::set_sftp(err, STK_FX_FAILURE);
			LOG_ERR("Unable to open remote file '%s': is a directory\n",
				path.c_str());
			return -1;
		}
	}

	*handle = static_cast<RemoteHandle_t>(fh);

	return 0;
}

int64_t SftpChannel::read(RemoteHandle_t handle, char* buf, size_t n,
	uint32_t timeout_ms, ErrCause_t* err)
{
	ssize_t    nread    = 0;
	Deadline_t deadline = prv_deadline(timeout_ms);

	while (FN_RC_EAGAIN(nread, libssh2_sftp_read(prv_handle(handle), buf, n))) {
		if (waitsocket(conn, deadline) <= 0) {
			nread = LIBSSH2_ERROR_TIMEOUT;
			break;
		}
	}

	if (nread < 0) {
		prv_set_error(conn, static_cast<int32_t>(nread), err);
		return -1;
	}

	return static_cast<int64_t>(nread);
}

int32_t SftpChannel::write(RemoteHandle_t handle, const char* buf, size_t n,
	uint32_t timeout_ms, ErrCause_t* err)
{
	Deadline_t  deadline = prv_deadline(timeout_ms);
	const char* ptr      = buf;

	// write to remote untill all bytes are written
	while (n > 0) {
		ssize_t nwritten = 0;

		while (FN_RC_EAGAIN(
			nwritten, libssh2_sftp_write(prv_handle(handle), ptr, n))) {
			if (waitsocket(conn, deadline) <= 0) {
				nwritten = LIBSSH2_ERROR_TIMEOUT;
				break;
			}
		}

		if (nwritten < 0) {
			prv_set_error(conn, static_cast<int32_t>(nwritten), err);
			return -1;
		}

		ptr += nwritten;
		n -= static_cast<size_t>(nwritten);
	}

	return 0;
}

int32_t SftpChannel::close(
	RemoteHandle_t handle, uint32_t timeout_ms, ErrCause_t* err)
{
	int32_t rc = 0;

	WAIT_EAGAIN(conn, rc, libssh2_sftp_close_handle(prv_handle(handle)),
		prv_deadline(timeout_ms));

	if (rc) {
		prv_set_error(conn, rc, err);
		return -1;
	}

	return 0;
}
