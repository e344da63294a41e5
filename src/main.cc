#include <getopt.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "debug.hpp"
#include "sftp_err.hpp"
#include "sftp_local.hpp"
#include "sftp_remote.hpp"
#include "sftp_toolkit.hpp"
#include "sftp_transfer.hpp"
#include "sftp_tree.hpp"

#define STK_EXIT_OK    0
#define STK_EXIT_FAIL  1
#define STK_EXIT_USAGE 2

#define STK_ENV_PASSWORD "SFTP_TOOLKIT_PASSWORD"

typedef struct CliArgs_s CliArgs_t;

struct CliArgs_s {
	SftpConn_t conn;

	uint32_t timeout_ms = STK_DEFAULT_TIMEOUT_MS;
	uint32_t chunk_size = STK_DEFAULT_CHUNK_SIZE;
	bool     all_types  = false;
	bool     long_list  = false;

	std::string              command;
	std::vector<std::string> args;
};

namespace {

static void usage(const char* prog)
{
	fprintf(stderr,
		"usage: %s [options] <host> <command> [args]\n"
		"\n"
		"commands:\n"
		"  mkdir  <path>             create path and its parents\n"
		"  ls     <path>             list the tree under path\n"
		"  rmtree <path>             remove path with all its content\n"
		"  get    <remote> <local>   download a file\n"
		"  put    <local> <remote>   upload a file\n"
		"\n"
		"options:\n"
		"  -P port        ssh port (default 22)\n"
		"  -u user        username\n"
		"  -p password    password, or " STK_ENV_PASSWORD " from environment\n"
		"  -k pubkey      public key file\n"
		"  -K privkey     private key file\n"
		"  -t timeout_ms  timeout of each request (default %u)\n"
		"  -c chunk_size  transfer chunk size (default %u)\n"
		"  -a             list every file type, not only regular files\n"
		"  -l             long listing\n",
		prog, STK_DEFAULT_TIMEOUT_MS, STK_DEFAULT_CHUNK_SIZE);
}

static bool prv_parse_u32(const char* str, uint32_t max, uint32_t* out)
{
	char* end = nullptr;

	errno                = 0;
	unsigned long long v = strtoull(str, &end, 10);

	if (errno || !end || *end != '\0' || end == str || v > max) return false;

	*out = static_cast<uint32_t>(v);

	return true;
}

static size_t prv_nargs(const std::string& cmd)
{
	if (cmd == "mkdir" || cmd == "ls" || cmd == "rmtree") return 1;
	if (cmd == "get" || cmd == "put") return 2;

	return 0;
}

/** @return 0 when args are usable, STK_EXIT_USAGE otherwise */
static int32_t parse_args(int argc, char* argv[], CliArgs_t* args)
{
	int      opt;
	uint32_t val;

	while ((opt = getopt(argc, argv, "P:u:p:k:K:t:c:alh")) != -1) {
		switch (opt) {

		case 'P': {
			if (!prv_parse_u32(optarg, UINT16_MAX, &val) || val == 0) {
				LOG_ERR("'port' is invalid: %s\n", optarg);
				return STK_EXIT_USAGE;
			}

			args->conn.port = static_cast<uint16_t>(val);
		} break;

		case 'u': args->conn.username = optarg; break;
		case 'p': args->conn.password = optarg; break;
		case 'k': args->conn.pubkey = optarg; break;
		case 'K': args->conn.privkey = optarg; break;

		case 't': {
			if (!prv_parse_u32(optarg, UINT32_MAX, &val) || val == 0) {
				LOG_ERR("'timeout' is invalid: %s\n", optarg);
				return STK_EXIT_USAGE;
			}

			args->timeout_ms = val;
		} break;

		case 'c': {
			if (!prv_parse_u32(optarg, UINT32_MAX, &val) || val == 0) {
				LOG_ERR("'chunk_size' is invalid: %s\n", optarg);
				return STK_EXIT_USAGE;
			}

			args->chunk_size = val;
		} break;

		case 'a': args->all_types = true; break;
		case 'l': args->long_list = true; break;

		default: return STK_EXIT_USAGE;
		}
	}

	if (argc - optind < 2) {
		LOG_ERR("'host' and 'command' are required\n");
		return STK_EXIT_USAGE;
	}

	args->conn.host = argv[optind++];
	args->command   = argv[optind++];

	for (; optind < argc; optind++) args->args.push_back(argv[optind]);

	size_t nargs = prv_nargs(args->command);
	if (nargs == 0) {
		LOG_ERR("unknown command '%s'\n", args->command.c_str());
		return STK_EXIT_USAGE;
	}

	if (args->args.size() != nargs) {
		LOG_ERR("'%s' expects %zu argument(s)\n", args->command.c_str(), nargs);
		return STK_EXIT_USAGE;
	}

	if (args->conn.host.empty()) {
		LOG_ERR("'host' is empty\n");
		return STK_EXIT_USAGE;
	}

	if (args->conn.username.empty()) {
		LOG_ERR("'username' is undefined\n");
		return STK_EXIT_USAGE;
	}

	if (args->conn.pubkey.empty() != args->conn.privkey.empty()) {
		LOG_ERR("'pubkey' and 'privkey' must be given together\n");
		return STK_EXIT_USAGE;
	}

	if (args->conn.password.empty()) {
		const char* env = getenv(STK_ENV_PASSWORD);
		if (env) args->conn.password = env;
	}

	if (args->conn.pubkey.empty() && args->conn.password.empty()) {
		LOG_ERR("invalid auth, give a key pair or a password\n");
		return STK_EXIT_USAGE;
	}

	/* session setup shares the per-request timeout, rounded up to seconds */
	uint32_t sec = (args->timeout_ms / 1000U) + ((args->timeout_ms % 1000U) != 0);
	args->conn.timeout_sec
		= static_cast<int16_t>(sec > INT16_MAX ? INT16_MAX : sec);

	return 0;
}

static void print_item(const ListItem_t& item, bool long_list)
{
	if (!long_list || !item.has_info) {
		fprintf(stdout, "%s\n", item.path.c_str());
		return;
	}

	fprintf(stdout, "%c %04o %10llu %s\n", static_cast<char>(item.info.type),
		item.info.perm, static_cast<unsigned long long>(item.info.size),
		item.path.c_str());
}

static int32_t run_command(RemoteChannel& ch, const CliArgs_t& args,
	ToolkitErr_t* err)
{
	const std::string& cmd = args.command;

	if (cmd == "mkdir" || cmd == "rmtree") {
		TreeOpts_t opts;
		opts.timeout_ms = args.timeout_ms;

		return cmd == "mkdir"
			? SftpTree::make_dir_recursive(ch, args.args[0], opts, err)
			: SftpTree::del_dir_recursive(ch, args.args[0], opts, err);
	}

	if (cmd == "ls") {
		ListOpts_t   opts;
		ListResult_t result;

		opts.timeout_ms = args.timeout_ms;
		opts.result_format
			= args.long_list ? RESULT_FILE_INFO : RESULT_PATH;

		if (args.all_types) {
			opts.included_types = { IS_REG_FILE, IS_DIR, IS_SYMLINK,
				IS_CHR_FILE, IS_BLK_FILE, IS_PIPE, IS_SOCK, IS_INVALID };
		}

		if (SftpTree::list_dir_recursive(
				ch, args.args[0], opts, &result, err)) {
			return -1;
		}

		for (const ListItem_t& item : result) print_item(item, args.long_list);

		return 0;
	}

	PosixLocal     local;
	TransferOpts_t opts;

	opts.timeout_ms = args.timeout_ms;
	opts.chunk_size = args.chunk_size;

	if (cmd == "get") {
		return SftpTransfer::download_file(
			ch, local, args.args[0], args.args[1], opts, err);
	}

	return SftpTransfer::upload_file(
		ch, local, args.args[0], args.args[1], opts, err);
}

}

int main(int argc, char* argv[])
{
	CliArgs_t args;

	if (parse_args(argc, argv, &args)) {
		usage(argv[0]);
		return STK_EXIT_USAGE;
	}

	if (SftpRemote::connect(&args.conn) || SftpRemote::auth(&args.conn)) {
		fprintf(stderr, "unable to open session to %s@%s:%u: %s (%d)\n",
			args.conn.username.c_str(), args.conn.host.c_str(),
			args.conn.port, args.conn.last_error.msg.c_str(),
			args.conn.last_error.code);

		SftpRemote::disconnect(&args.conn);
		SftpRemote::shutdown();

		return STK_EXIT_FAIL;
	}

	SftpChannel  ch(&args.conn);
	ToolkitErr_t err;

	int32_t rc = run_command(ch, args, &err);

	if (rc) fprintf(stderr, "%s\n", SftpErr::format(err).c_str());

	SftpRemote::disconnect(&args.conn);
	SftpRemote::shutdown();

	return rc ? STK_EXIT_FAIL : STK_EXIT_OK;
}
