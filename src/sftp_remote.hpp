#ifndef _SFTP_REMOTE_HPP
#define _SFTP_REMOTE_HPP

#include "remote_channel.hpp"
#include "sftp_err.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <libssh2.h>
#include <libssh2_sftp.h>

#ifndef STK_HOSTKEY_HASH
#	define STK_HOSTKEY_HASH LIBSSH2_HOSTKEY_HASH_SHA1
#endif

#if ((STK_HOSTKEY_HASH) == (LIBSSH2_HOSTKEY_HASH_MD5))
#	define STK_FINGERPRINT_LEN 16U
#elif ((STK_HOSTKEY_HASH) == (LIBSSH2_HOSTKEY_HASH_SHA1))
#	define STK_FINGERPRINT_LEN 20U
#elif ((STK_HOSTKEY_HASH) == (LIBSSH2_HOSTKEY_HASH_SHA256))
#	define STK_FINGERPRINT_LEN 32U
#else
#	error "STK_HOSTKEY_HASH is undefined"
#endif

/** permission of files and directories created on the server */
#ifndef STK_REMOTE_FILE_MODE
#	define STK_REMOTE_FILE_MODE 0644
#endif

#ifndef STK_REMOTE_DIR_MODE
#	define STK_REMOTE_DIR_MODE 0755
#endif

#define STK_SEC2MS(s) (static_cast<uint32_t>(s) * 1000U)

typedef enum ConnStatus_e {
	STK_DISCONNECTED  = 0x00,
	STK_CONNECTED     = 0x01,
	STK_AUTHENTICATED = 0x02,
} ConnStatus_t;

typedef struct SftpConn_s SftpConn_t;

/** SSH connection settings and the live libssh2 session */
struct SftpConn_s {
	int16_t     timeout_sec = 60U; /**< handshake and authentication */
	uint16_t    port        = 22U;
	std::string host;
	std::string username;

	std::string pubkey;
	std::string privkey;
	std::string password;
	bool        use_keyboard = true;

	uint8_t status = STK_DISCONNECTED;

	libssh2_socket_t     sock         = LIBSSH2_INVALID_SOCKET;
	LIBSSH2_SESSION*     session      = nullptr;
	LIBSSH2_SFTP*        sftp_session = nullptr;
	std::vector<uint8_t> fingerprint;

	ErrCause_t last_error;
};

namespace SftpRemote {

void    shutdown();
int32_t connect(SftpConn_t* conn);
int32_t auth(SftpConn_t* conn);
void    disconnect(SftpConn_t* conn);
void    set_error(SftpConn_t* conn, ErrCause_t* cause);

uint8_t get_filetype(const LIBSSH2_SFTP_ATTRIBUTES& attrs);
uint8_t get_access(const LIBSSH2_SFTP_ATTRIBUTES& attrs);

}

/**
 * RemoteChannel over an authenticated libssh2 SFTP session. The connection is
 * borrowed and must outlive the channel.
 * */
class SftpChannel : public RemoteChannel {
public:
	explicit SftpChannel(SftpConn_t* conn);

	int32_t stat(const std::string& path, EntryInfo_t* info,
		uint32_t timeout_ms, ErrCause_t* err) override;
	int32_t list(const std::string& path, std::vector<std::string>* names,
		uint32_t timeout_ms, ErrCause_t* err) override;
	int32_t mkdir(const std::string& path, uint32_t timeout_ms,
		ErrCause_t* err) override;
	int32_t remove_file(const std::string& path, uint32_t timeout_ms,
		ErrCause_t* err) override;
	int32_t remove_dir(const std::string& path, uint32_t timeout_ms,
		ErrCause_t* err) override;
	int32_t open(const std::string& path, uint8_t mode, RemoteHandle_t* handle,
		uint32_t timeout_ms, ErrCause_t* err) override;
	int64_t read(RemoteHandle_t handle, char* buf, size_t n,
		uint32_t timeout_ms, ErrCause_t* err) override;
	int32_t write(RemoteHandle_t handle, const char* buf, size_t n,
		uint32_t timeout_ms, ErrCause_t* err) override;
	int32_t close(RemoteHandle_t handle, uint32_t timeout_ms,
		ErrCause_t* err) override;

private:
	SftpConn_t* conn = nullptr;
};

#endif
