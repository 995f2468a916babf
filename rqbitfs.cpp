#define FUSE_USE_VERSION 26

#include <fuse.h>
#include <fuse_opt.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/bind/bind.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include <boost/ref.hpp>
#include "FS.hpp"
#include "config.hpp"
#include "http_range_source.hpp"
#include "logger.hpp"
#include "mount_runtime.hpp"
#include "rqbit_backend.hpp"
#include "rqbit_client.hpp"
#include "rqbitfs_error.hpp"
#include "stream_manager.hpp"
#include "torrent_fs.hpp"

static const char RQBITFS_VERSION[] = "0.1.0";

static const char MOUNT_OPTIONS[] = "ro,nosuid,nodev,noatime,fsname=rqbitfs,subtype=rqbitfs";

struct rqbitfs_options {
  char *config;
  char *api_url;
  char *username;
  char *password;
  char *log_level;
  char *log_file;
  char *read_timeout;
  int show_help;
  int show_version;
};

static struct rqbitfs_options options;
static std::string mount_point_arg;

#define OPTION(t, p)                           \
    { t, offsetof(struct rqbitfs_options, p), 1 }
static const struct fuse_opt option_spec[] = {
  OPTION("--config=%s", config),
  OPTION("--api-url=%s", api_url),
  OPTION("--username=%s", username),
  OPTION("--password=%s", password),
  OPTION("--log-level=%s", log_level),
  OPTION("--log-file=%s", log_file),
  OPTION("--read-timeout=%s", read_timeout),
  OPTION("-h", show_help),
  OPTION("--help", show_help),
  OPTION("-V", show_version),
  OPTION("--version", show_version),
  FUSE_OPT_END
};

/* Remembers the first non-option argument as the mount point and passes
   everything else on to fuse */
static int option_proc(void *data, const char *arg, int key,
                       struct fuse_args *outargs) {
  (void) data;
  (void) outargs;
  if (key == FUSE_OPT_KEY_NONOPT && mount_point_arg.empty())
    mount_point_arg = arg;
  return 1;
}

static void show_help(const char *progname) {
  printf("usage: %s [options] [<mountpoint>]\n\n", progname);
  printf("Mounts the torrents of an rqbit server as a read-only filesystem.\n\n"
         "rqbitfs options:\n"
         "    --config=<path>        JSON configuration file\n"
         "    --api-url=<url>        rqbit API base URL (default http://127.0.0.1:3030)\n"
         "    --username=<name>      HTTP Basic auth user\n"
         "    --password=<secret>    HTTP Basic auth password\n"
         "    --log-level=<level>    error, warn, info, debug or trace\n"
         "    --log-file=<path>      log to a file instead of stderr\n"
         "    --read-timeout=<secs>  how long a read waits for data\n"
         "    -V, --version          print the version and exit\n"
         "\n");
}

static int getattr_wrapper(const char *path, struct stat *statbuf) {
  return FS::Instance()->getattr(path, statbuf);
}

static int readlink_wrapper(const char *path, char *link, size_t size) {
  return FS::Instance()->readlink(path, link, size);
}

static int open_wrapper(const char *path, struct fuse_file_info *fileInfo) {
  return FS::Instance()->open(path, fileInfo);
}

static int read_wrapper(const char *path, char *buf, size_t size,
                        off_t offset, struct fuse_file_info *fileInfo) {
  return FS::Instance()->read(path, buf, size, offset, fileInfo);
}

static int release_wrapper(const char *path, struct fuse_file_info *fileInfo) {
  return FS::Instance()->release(path, fileInfo);
}

static int opendir_wrapper(const char *path, struct fuse_file_info *fileInfo) {
  return FS::Instance()->opendir(path, fileInfo);
}

static int readdir_wrapper(const char *path, void *buf, fuse_fill_dir_t filler,
                           off_t offset, struct fuse_file_info *fileInfo) {
  return FS::Instance()->readdir(path, buf, filler, offset, fileInfo);
}

static int statfs_wrapper(const char *path, struct statvfs *statInfo) {
  return FS::Instance()->statfs(path, statInfo);
}

static int access_wrapper(const char *path, int mask) {
  return FS::Instance()->access(path, mask);
}

static int getxattr_wrapper(const char *path, const char *name, char *value,
                            size_t size) {
  return FS::Instance()->getxattr(path, name, value, size);
}

static int listxattr_wrapper(const char *path, char *list, size_t size) {
  return FS::Instance()->listxattr(path, list, size);
}

static int unlink_wrapper(const char *path) {
  return FS::Instance()->unlink(path);
}

static int mkdir_wrapper(const char *path, mode_t mode) {
  (void) mode;
  return FS::Instance()->read_only(path, "mkdir");
}

static int rmdir_wrapper(const char *path) {
  return FS::Instance()->read_only(path, "rmdir");
}

static int mknod_wrapper(const char *path, mode_t mode, dev_t dev) {
  (void) mode;
  (void) dev;
  return FS::Instance()->read_only(path, "mknod");
}

static int create_wrapper(const char *path, mode_t mode,
                          struct fuse_file_info *fileInfo) {
  (void) mode;
  (void) fileInfo;
  return FS::Instance()->read_only(path, "create");
}

static int write_wrapper(const char *path, const char *buf, size_t size,
                         off_t offset, struct fuse_file_info *fileInfo) {
  (void) buf;
  (void) size;
  (void) offset;
  (void) fileInfo;
  return FS::Instance()->read_only(path, "write");
}

static int rename_wrapper(const char *from, const char *to) {
  (void) to;
  return FS::Instance()->read_only(from, "rename");
}

static int link_wrapper(const char *from, const char *to) {
  (void) from;
  return FS::Instance()->read_only(to, "link");
}

static int symlink_wrapper(const char *from, const char *to) {
  (void) from;
  return FS::Instance()->read_only(to, "symlink");
}

static int chmod_wrapper(const char *path, mode_t mode) {
  (void) mode;
  return FS::Instance()->read_only(path, "chmod");
}

static int chown_wrapper(const char *path, uid_t uid, gid_t gid) {
  (void) uid;
  (void) gid;
  return FS::Instance()->read_only(path, "chown");
}

static int truncate_wrapper(const char *path, off_t size) {
  (void) size;
  return FS::Instance()->read_only(path, "truncate");
}

static int setxattr_wrapper(const char *path, const char *name,
                            const char *value, size_t size, int flags) {
  (void) name;
  (void) value;
  (void) size;
  (void) flags;
  return FS::Instance()->read_only(path, "setxattr");
}

static int removexattr_wrapper(const char *path, const char *name) {
  (void) name;
  return FS::Instance()->read_only(path, "removexattr");
}

static int utimens_wrapper(const char *path, const struct timespec tv[2]) {
  (void) tv;
  return FS::Instance()->read_only(path, "utimens");
}

static void* init_wrapper(struct fuse_conn_info *conn) {
  return FS::Instance()->init(conn);
}

static void destroy_wrapper(void *private_data) {
  FS::Instance()->destroy(private_data);
}

static struct fuse_operations rqbitfs_operations;

/* Let fuse know which operations are supported */
static void init_fuse_operations() {
  memset(&rqbitfs_operations, 0, sizeof(rqbitfs_operations));
  rqbitfs_operations.getattr = getattr_wrapper;
  rqbitfs_operations.readlink = readlink_wrapper;
  rqbitfs_operations.mknod = mknod_wrapper;
  rqbitfs_operations.mkdir = mkdir_wrapper;
  rqbitfs_operations.unlink = unlink_wrapper;
  rqbitfs_operations.rmdir = rmdir_wrapper;
  rqbitfs_operations.symlink = symlink_wrapper;
  rqbitfs_operations.rename = rename_wrapper;
  rqbitfs_operations.link = link_wrapper;
  rqbitfs_operations.chmod = chmod_wrapper;
  rqbitfs_operations.chown = chown_wrapper;
  rqbitfs_operations.truncate = truncate_wrapper;
  rqbitfs_operations.open = open_wrapper;
  rqbitfs_operations.read = read_wrapper;
  rqbitfs_operations.write = write_wrapper;
  rqbitfs_operations.statfs = statfs_wrapper;
  rqbitfs_operations.release = release_wrapper;
  rqbitfs_operations.setxattr = setxattr_wrapper;
  rqbitfs_operations.getxattr = getxattr_wrapper;
  rqbitfs_operations.listxattr = listxattr_wrapper;
  rqbitfs_operations.removexattr = removexattr_wrapper;
  rqbitfs_operations.opendir = opendir_wrapper;
  rqbitfs_operations.readdir = readdir_wrapper;
  rqbitfs_operations.init = init_wrapper;
  rqbitfs_operations.destroy = destroy_wrapper;
  rqbitfs_operations.access = access_wrapper;
  rqbitfs_operations.create = create_wrapper;
  rqbitfs_operations.utimens = utimens_wrapper;
}

/* Applies the command line on top of file and environment settings */
static bool apply_cli_options(rqbitfs_config &cfg) {
  if (options.api_url)
    cfg.api.url = options.api_url;
  if (options.username)
    cfg.api.username = options.username;
  if (options.password)
    cfg.api.password = options.password;
  if (options.log_level)
    cfg.logging.level = options.log_level;
  if (options.log_file)
    cfg.logging.file = options.log_file;
  if (options.read_timeout) {
    try {
      cfg.performance.read_timeout = boost::lexical_cast<uint64_t>(options.read_timeout);
    } catch (const boost::bad_lexical_cast &) {
      fprintf(stderr, "rqbitfs: invalid --read-timeout value '%s'\n", options.read_timeout);
      return false;
    }
  }
  if (!mount_point_arg.empty())
    cfg.mount.mount_point = mount_point_arg;
  return true;
}

static bool load_config(rqbitfs_config &cfg) {
  boost::system::error_code ec;
  if (options.config) {
    ec = cfg.load_file(options.config);
    if (ec) {
      fprintf(stderr, "rqbitfs: cannot load %s: %s\n", options.config, ec.message().c_str());
      return false;
    }
  } else {
    std::string loaded_from;
    ec = cfg.load_default_locations(loaded_from);
    if (ec) {
      fprintf(stderr, "rqbitfs: cannot load %s: %s\n", loaded_from.c_str(),
              ec.message().c_str());
      return false;
    }
  }

  ec = cfg.merge_env();
  if (ec) {
    fprintf(stderr, "rqbitfs: bad environment setting: %s\n", ec.message().c_str());
    return false;
  }
  if (!apply_cli_options(cfg))
    return false;

  std::vector<config_issue> issues = cfg.validate();
  for (size_t i = 0; i < issues.size(); i++)
    fprintf(stderr, "rqbitfs: %s: %s\n", issues[i].field.c_str(), issues[i].message.c_str());
  return issues.empty();
}

static bool setup_logging(const rqbitfs_config &cfg) {
  log_level level;
  if (!logger::parse_level(cfg.logging.level, level)) {
    fprintf(stderr, "rqbitfs: unknown log level %s\n", cfg.logging.level.c_str());
    return false;
  }
  logger::set_level(level);
  if (!cfg.logging.file.empty() && !logger::set_output(cfg.logging.file)) {
    fprintf(stderr, "rqbitfs: cannot open log file %s\n", cfg.logging.file.c_str());
    return false;
  }
  return true;
}

int main(int argc, char *argv[]) {
  struct fuse_args args = FUSE_ARGS_INIT(argc, argv);

  memset(&options, 0, sizeof(options));
  if (fuse_opt_parse(&args, &options, option_spec, option_proc) == -1)
    return 1;

  if (options.show_version) {
    printf("rqbitfs %s\n", RQBITFS_VERSION);
    fuse_opt_free_args(&args);
    return 0;
  }

  /* print our own help first, then let fuse_main add its options */
  if (options.show_help) {
    show_help(argv[0]);
    if (fuse_opt_add_arg(&args, "--help") != 0)
      return 1;
    args.argv[0][0] = '\0';
    init_fuse_operations();
    int ret = fuse_main(args.argc, args.argv, &rqbitfs_operations, NULL);
    fuse_opt_free_args(&args);
    return ret;
  }

  rqbitfs_config cfg;
  if (!load_config(cfg) || !setup_logging(cfg)) {
    fuse_opt_free_args(&args);
    return 1;
  }

  http_endpoint endpoint;
  if (!parse_http_url(cfg.api.url, endpoint)) {
    fprintf(stderr, "rqbitfs: unsupported API URL %s\n", cfg.api.url.c_str());
    fuse_opt_free_args(&args);
    return 1;
  }

  rqbit_client_options client_options;
  client_options.username = cfg.api.username;
  client_options.password = cfg.api.password;
  client_options.metadata_ttl = std::chrono::seconds(cfg.cache.metadata_ttl);
  client_options.max_cache_entries = cfg.cache.max_entries;
  boost::shared_ptr<rqbit_client> client =
    boost::make_shared<rqbit_client>(endpoint, client_options);

  logger::log(LOG_INFO, "waiting for rqbit at " + cfg.api.url);
  boost::system::error_code ec = client->wait_for_server(std::chrono::seconds(30));
  if (ec) {
    logger::log(LOG_ERROR, "rqbit at " + cfg.api.url + " is not reachable: " + ec.message());
    fuse_opt_free_args(&args);
    return 1;
  }

  /* threads do not survive fuse_daemonize's fork; the runtime starts from
     the FUSE init callback */
  mount_runtime runtime(
    cfg, *client,
    [endpoint, cfg](boost::asio::io_context &ioc) -> boost::shared_ptr<range_source> {
      return boost::make_shared<http_range_source>(
        boost::ref(ioc), endpoint, cfg.api.username, cfg.api.password);
    },
    [client, cfg](boost::shared_ptr<stream_manager> streams)
      -> boost::shared_ptr<bridge_backend> {
      return boost::make_shared<rqbit_backend>(
        streams, client, static_cast<size_t>(cfg.performance.worker_threads));
    });

  FS::Instance()->attach(
    [&runtime]() {
      torrent_fs *fs = runtime.start();
      boost::system::error_code ec = fs->refresh_torrents();
      if (ec)
        logger::log(LOG_WARN, "initial torrent discovery failed: " + ec.message());
      return fs;
    },
    boost::bind(&mount_runtime::stop, &runtime));

  if (mount_point_arg.empty() && fuse_opt_add_arg(&args, cfg.mount.mount_point.c_str()) != 0)
    return 1;
  std::string mount_options = std::string(MOUNT_OPTIONS) + ",max_read="
    + boost::lexical_cast<std::string>(MAX_READ_SIZE);
  if (cfg.mount.allow_other)
    mount_options += ",allow_other";
  if (fuse_opt_add_arg(&args, "-o") != 0
      || fuse_opt_add_arg(&args, mount_options.c_str()) != 0)
    return 1;

  logger::log(LOG_INFO, "mounting rqbitfs at " + cfg.mount.mount_point);
  init_fuse_operations();
  int ret = fuse_main(args.argc, args.argv, &rqbitfs_operations, NULL);

  runtime.stop();
  fuse_opt_free_args(&args);
  return ret;
}
