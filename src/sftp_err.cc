#include "sftp_err.hpp"
#include "sftp_toolkit.hpp"

#include <cerrno>
#include <cstring>
#include <unordered_map>

namespace {

static const std::unordered_map<int32_t, const char*> sftp_err_msg = {
	{ 0,  "ok"                   },
	{ 1,  "eof"                  },
	{ 2,  "no_such_file"         },
	{ 3,  "permission_denied"    },
	{ 4,  "failure"              },
	{ 5,  "bad_message"          },
	{ 6,  "no_connection"        },
	{ 7,  "connection_lost"      },
	{ 8,  "op_unsupported"       },
	{ 9,  "invalid_handle"       },
	{ 10, "no_such_path"         },
	{ 11, "file_already_exists"  },
	{ 12, "write_protect"        },
	{ 13, "no_media"             },
	{ 14, "no_space_on_filesystem" },
	{ 15, "quota_exceeded"       },
	{ 16, "unknown_principal"    },
	{ 17, "lock_conflict"        },
	{ 18, "dir_not_empty"        },
	{ 19, "not_a_directory"      },
	{ 20, "invalid_filename"     },
	{ 21, "link_loop"            },
};

static const std::unordered_map<int32_t, const char*> session_err_msg = {
	{ 0,   "none"                     },
	{ -1,  "socket_none"              },
	{ -2,  "banner_recv"              },
	{ -3,  "banner_send"              },
	{ -4,  "invalid_mac"              },
	{ -5,  "kex_failure"              },
	{ -6,  "alloc"                    },
	{ -7,  "socket_send"              },
	{ -8,  "key_exchange_failure"     },
	{ -9,  "timeout"                  },
	{ -10, "hostkey_init"             },
	{ -11, "hostkey_sign"             },
	{ -12, "decrypt"                  },
	{ -13, "socket_disconnect"        },
	{ -14, "proto"                    },
	{ -15, "password_expired"         },
	{ -16, "file"                     },
	{ -17, "method_none"              },
	{ -18, "authentication_failed"    },
	{ -19, "publickey_unverified"     },
	{ -20, "channel_outoforder"       },
	{ -21, "channel_failure"          },
	{ -22, "channel_request_denied"   },
	{ -23, "channel_unknown"          },
	{ -24, "channel_window_exceeded"  },
	{ -25, "channel_packet_exceeded"  },
	{ -26, "channel_closed"           },
	{ -27, "channel_eof_sent"         },
	{ -28, "scp_protocol"             },
	{ -29, "zlib"                     },
	{ -30, "socket_timeout"           },
	{ -31, "sftp_protocol"            },
	{ -32, "request_denied"           },
	{ -33, "method_not_supported"     },
	{ -34, "inval"                    },
	{ -35, "invalid_poll_type"        },
	{ -36, "publickey_protocol"       },
	{ -37, "eagain"                   },
	{ -38, "buffer_too_small"         },
	{ -39, "bad_use"                  },
	{ -40, "compress"                 },
	{ -41, "out_of_boundary"          },
	{ -42, "agent_protocol"           },
	{ -43, "socket_recv"              },
	{ -44, "encrypt"                  },
	{ -45, "bad_socket"               },
	{ -46, "known_hosts"              },
	{ -47, "channel_window_full"      },
	{ -48, "keyfile_auth_failed"      },
	{ -49, "randgen"                  },
	{ -50, "missing_userauth_banner"  },
	{ -51, "algo_unsupported"         },
	{ -52, "mac_failure"              },
	{ -53, "hash_init"                },
	{ -54, "hash_calc"                },
};

/*
 * Only the errno values a file open/read/write/close can realistically
 * produce are named, everything else falls back to strerror().
 * */
static const std::unordered_map<int32_t, const char*> errno_msg = {
	{ EACCES,  "eacces"  },
	{ ENOENT,  "enoent"  },
	{ EISDIR,  "eisdir"  },
	{ ENOTDIR, "enotdir" },
	{ EEXIST,  "eexist"  },
	{ EPERM,   "eperm"   },
	{ EROFS,   "erofs"   },
	{ ENOSPC,  "enospc"  },
	{ EDQUOT,  "edquot"  },
	{ EIO,     "eio"     },
	{ EBADF,   "ebadf"   },
	{ EMFILE,  "emfile"  },
	{ ENFILE,  "enfile"  },
	{ ENAMETOOLONG, "enametoolong" },
	{ ELOOP,   "eloop"   },
	{ EFBIG,   "efbig"   },
	{ EINVAL,  "einval"  },
};

static const std::unordered_map<uint8_t, const char*> tag_msg = {
	{ ERR_TAG_NONE,           "none"           },
	{ ERR_TAG_LOCAL_OPEN,     "local_open"     },
	{ ERR_TAG_REMOTE_OPEN,    "remote_open"    },
	{ ERR_TAG_TRANSFER,       "transfer"       },
	{ ERR_TAG_REMOTE_CLOSE,   "remote_close"   },
	{ ERR_TAG_LOCAL_CLOSE,    "local_close"    },
	{ ERR_TAG_MAKE_DIR,       "make_dir"       },
	{ ERR_TAG_FILE_INFO,      "file_info"      },
	{ ERR_TAG_INVALID_TYPE,   "invalid_type"   },
	{ ERR_TAG_INVALID_ACCESS, "invalid_access" },
	{ ERR_TAG_LIST_DIR,       "list_dir"       },
	{ ERR_TAG_DEL_FILE,       "del_file"       },
	{ ERR_TAG_DEL_DIR,        "del_dir"        },
};

static const char* prv_lookup(
	const std::unordered_map<int32_t, const char*>& table, int32_t code)
{
	auto it = table.find(code);
	return it == table.end() ? nullptr : it->second;
}

}

const char* SftpErr::sftp_error(int32_t code)
{
	return prv_lookup(sftp_err_msg, code);
}

const char* SftpErr::session_error(int32_t code)
{
	return prv_lookup(session_err_msg, code);
}

const char* SftpErr::tag_name(uint8_t tag)
{
	auto it = tag_msg.find(tag);
	return it == tag_msg.end() ? "unknown" : it->second;
}

const char* SftpErr::type_name(uint8_t type)
{
	switch (type) {
	case IS_REG_FILE: return "regular";
	case IS_DIR: return "directory";
	case IS_SYMLINK: return "symlink";
	case IS_CHR_FILE:
	case IS_BLK_FILE: return "device";
	case IS_PIPE:
	case IS_SOCK: return "other";
	default: return "unknown";
	}
}

const char* SftpErr::access_name(uint8_t access)
{
	switch (access) {
	case ACCESS_READ: return "read";
	case ACCESS_WRITE: return "write";
	case ACCESS_READ_WRITE: return "read_write";
	default: return "none";
	}
}

void SftpErr::set_sftp(ErrCause_t* cause, int32_t code)
{
	const char* msg = SftpErr::sftp_error(code);

	cause->type = ERR_FROM_SFTP;
	cause->code = code;
	cause->msg  = msg ? msg : "sftp_status_" + std::to_string(code);
}

void SftpErr::set_session(ErrCause_t* cause, int32_t code)
{
	const char* msg = SftpErr::session_error(code);

	cause->type = ERR_FROM_SESSION;
	cause->code = code;
	cause->msg  = msg ? msg : "session_error_" + std::to_string(code);
}

void SftpErr::set_errno(ErrCause_t* cause, int32_t err)
{
	const char* msg = prv_lookup(errno_msg, err);

	cause->type = ERR_FROM_LOCAL;
	cause->code = err;
	cause->msg  = msg ? msg : strerror(err);
}

void SftpErr::set_custom(ErrCause_t* cause, int32_t code, const char* msg)
{
	cause->type = ERR_FROM_CUSTOM;
	cause->code = code;
	cause->msg  = msg ? msg : "";
}

bool SftpErr::is_not_found(const ErrCause_t& cause)
{
	if (cause.type == ERR_FROM_SFTP) {
		return cause.code == STK_FX_NO_SUCH_FILE
			|| cause.code == STK_FX_NO_SUCH_PATH;
	}

	return cause.type == ERR_FROM_LOCAL && cause.code == ENOENT;
}

void SftpErr::clear(ToolkitErr_t* err)
{
	if (!err) return;

	*err = ToolkitErr_t();
}

std::string SftpErr::format(const ToolkitErr_t& err)
{
	std::string res = SftpErr::tag_name(err.tag);

	if (err.tag == ERR_TAG_TRANSFER) {
		res += err.direction == XFER_UPLOAD ? "/upload" : "/download";
		res += err.side == XFER_SIDE_WRITE ? "/write" : "/read";
	}

	if (!err.path.empty()) res += " '" + err.path + "'";

	switch (err.tag) {

	case ERR_TAG_INVALID_TYPE: {
		res += std::string(": ") + SftpErr::type_name(err.file_type);
	} break;

	case ERR_TAG_INVALID_ACCESS: {
		res += std::string(": ") + SftpErr::access_name(err.access);
	} break;

	default: {
		if (err.cause.type == ERR_FROM_NONE) break;
		res += ": " + err.cause.msg + " (" + std::to_string(err.cause.code)
			+ ")";
	} break;
	}

	return res;
}
