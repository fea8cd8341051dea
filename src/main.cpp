#define _FILE_OFFSET_BITS 64

#include "extract/batch_extractor.hpp"
#include "nav/archive_view.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <archive> <command> [args]\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>    Config file (default /etc/arcnav/arcnav.conf)\n"
        "  -C, --cd <dir>         Change directory inside the archive first\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n"
        "\n"
        "Commands:\n"
        "  pwd\n"
        "  ls [path] [-r]\n"
        "  cat <path> [--encoding utf-8|ascii|latin-1|binary]\n"
        "  info <path>\n"
        "  stat <path>\n"
        "  extract <output_dir> [--batch-size N] [--subdir S] [--reset] [--seed N]\n"
        "          [--ext .csv[,.txt]] [--on-error skip|abort] [--max-retries N]\n"
        "          [--validate-crc] [--max-batches N]\n"
        "  resume <output_dir> [--subdir S] [--max-batches N]\n"
        "  status <output_dir> [--subdir S]\n"
        "  reset <output_dir> [--subdir S]\n"
        "\n"
        "--max-batches defaults to 1; 0 extracts every remaining batch.\n",
        argv);
}

bool ParseU64(const char *text, std::uint64_t &out) {
    if (!text || *text == '\0' || *text == '-')
        return false;
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool ParseI64(const char *text, std::int64_t &out) {
    if (!text || *text == '\0')
        return false;
    char *end = nullptr;
    errno = 0;
    long long v = std::strtoll(text, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

void SplitExtensions(const char *text, std::vector<std::string> &out) {
    std::string cur;
    for (const char *p = text; *p; ++p) {
        if (*p == ',') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(*p);
        }
    }
    out.push_back(cur);
}

int Fail(const arcnav::Result &r) {
    std::fprintf(stderr, "ERROR: %s: %s\n", arcnav::ErrorCodeName(r.code), r.msg.c_str());
    return kExitError;
}

void PrintJson(const nlohmann::json &j) {
    std::printf("%s\n", j.dump(2).c_str());
}

struct ToolContext {
    const char *prog = nullptr;
    arcnav::config::ArcnavConfigFromFile cfg;
    arcnav::ArchiveView view;
};

// Subcommands use their own getopt_long pass over argv[0..argc), where
// argv[0] is the command name.
void ResetGetopt() {
    optind = 0;
}

int CmdPwd(ToolContext &ctx, int argc, char **) {
    if (argc != 1) {
        PrintUsage(ctx.prog);
        return kExitUsage;
    }
    std::printf("%s\n", ctx.view.Pwd().c_str());
    return kExitOk;
}

int CmdLs(ToolContext &ctx, int argc, char **argv) {
    static option long_opts[] = {
        {"recursive", no_argument, nullptr, 'r'},
        {nullptr, 0, nullptr, 0},
    };

    bool recursive = false;
    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "r", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'r':
                recursive = true;
                break;
            default:
                PrintUsage(ctx.prog);
                return kExitUsage;
        }
    }
    if (argc - optind > 1) {
        PrintUsage(ctx.prog);
        return kExitUsage;
    }
    const char *path = optind < argc ? argv[optind] : "";

    std::vector<std::string> entries;
    if (auto r = ctx.view.List(path, recursive, entries); !r.is_ok())
        return Fail(r);
    for (const auto &e : entries) {
        std::printf("%s\n", e.c_str());
    }
    return kExitOk;
}

int CmdCat(ToolContext &ctx, int argc, char **argv) {
    static option long_opts[] = {
        {"encoding", required_argument, nullptr, 'e'},
        {nullptr, 0, nullptr, 0},
    };

    std::string encoding;
    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "e:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'e':
                encoding = optarg;
                break;
            default:
                PrintUsage(ctx.prog);
                return kExitUsage;
        }
    }
    if (argc - optind != 1) {
        PrintUsage(ctx.prog);
        return kExitUsage;
    }

    std::string data;
    if (auto r = ctx.view.ReadText(argv[optind], encoding, data); !r.is_ok())
        return Fail(r);
    if (std::fwrite(data.data(), 1, data.size(), stdout) != data.size()) {
        std::fprintf(stderr, "ERROR: write to stdout failed: %s\n", std::strerror(errno));
        return kExitError;
    }
    return kExitOk;
}

int CmdInfo(ToolContext &ctx, int argc, char **argv) {
    if (argc != 2) {
        PrintUsage(ctx.prog);
        return kExitUsage;
    }

    arcnav::MemberInfo info;
    if (auto r = ctx.view.Info(argv[1], info); !r.is_ok())
        return Fail(r);

    char crc[16];
    std::snprintf(crc, sizeof(crc), "%08x", info.crc32.value_or(0));

    nlohmann::json j;
    j["filename"] = info.name;
    j["file_size"] = info.size;
    j["compress_size"] = info.compressed_size ? nlohmann::json(*info.compressed_size) : nlohmann::json(nullptr);
    j["mtime"] = info.mtime;
    j["compress_type"] = info.compression;
    j["crc32"] = crc;
    PrintJson(j);
    return kExitOk;
}

int CmdStat(ToolContext &ctx, int argc, char **argv) {
    if (argc != 2) {
        PrintUsage(ctx.prog);
        return kExitUsage;
    }

    std::string rel;
    if (auto r = ctx.view.Resolve(argv[1], rel); !r.is_ok())
        return Fail(r);
    const auto kind = ctx.view.Classify(rel);

    nlohmann::json j;
    j["path"] = "/" + rel;
    j["exists"] = kind != arcnav::ArchiveView::Kind::Missing;
    j["is_dir"] = kind == arcnav::ArchiveView::Kind::Directory;
    j["is_file"] = kind == arcnav::ArchiveView::Kind::File;
    PrintJson(j);
    return kExitOk;
}

void ApplyPreflight(const ToolContext &ctx, arcnav::BatchExtractor &ex) {
    arcnav::PreflightPolicy p = ex.Preflight();
    if (ctx.cfg.preflight_margin_ratio)
        p.margin_ratio = *ctx.cfg.preflight_margin_ratio;
    if (ctx.cfg.preflight_headroom_bytes)
        p.headroom_bytes = *ctx.cfg.preflight_headroom_bytes;
    ex.SetPreflightPolicy(p);
}

// Extracts up to `max_batches` batches (0: all), printing each extracted
// path. Stops early on SIGINT/SIGTERM with the state left resumable.
int RunBatches(arcnav::BatchExtractor &ex, std::uint64_t max_batches) {
    std::uint64_t done = 0;
    while (max_batches == 0 || done < max_batches) {
        if (arcnav::g_cancel.load(std::memory_order_relaxed)) {
            LogWarn("interrupted; progress saved");
            return kExitError;
        }

        std::vector<std::string> paths;
        bool exhausted = false;
        if (auto r = ex.NextBatch(paths, exhausted); !r.is_ok())
            return Fail(r);
        if (exhausted) {
            LogInfo("all members extracted");
            break;
        }

        for (const auto &p : paths) {
            std::printf("%s\n", p.c_str());
        }
        std::fflush(stdout);
        ++done;
    }

    const auto st = ex.Status();
    std::fprintf(stderr, "%zu/%zu extracted, %zu failed, %zu remaining\n",
                 st.extracted, st.total, st.failed_count, st.remaining);
    return kExitOk;
}

int CmdExtract(ToolContext &ctx, int argc, char **argv) {
    enum {
        kOptBatchSize = 1000,
        kOptSubdir,
        kOptReset,
        kOptSeed,
        kOptExt,
        kOptOnError,
        kOptMaxRetries,
        kOptValidateCrc,
        kOptMaxBatches,
    };
    static option long_opts[] = {
        {"batch-size", required_argument, nullptr, kOptBatchSize},
        {"subdir", required_argument, nullptr, kOptSubdir},
        {"reset", no_argument, nullptr, kOptReset},
        {"seed", required_argument, nullptr, kOptSeed},
        {"ext", required_argument, nullptr, kOptExt},
        {"on-error", required_argument, nullptr, kOptOnError},
        {"max-retries", required_argument, nullptr, kOptMaxRetries},
        {"validate-crc", no_argument, nullptr, kOptValidateCrc},
        {"max-batches", required_argument, nullptr, kOptMaxBatches},
        {nullptr, 0, nullptr, 0},
    };

    arcnav::BatchExtractor::InitOptions opt;
    const auto &cfg = ctx.cfg;
    if (cfg.batch_size)
        opt.batch_size = *cfg.batch_size;
    if (cfg.extract_subdir)
        opt.subdir = *cfg.extract_subdir;
    if (cfg.on_error)
        opt.on_error = *cfg.on_error;
    if (cfg.max_retries)
        opt.max_retries = *cfg.max_retries;
    if (cfg.validate_crc)
        opt.validate_crc = *cfg.validate_crc;
    if (cfg.extensions)
        opt.extensions = *cfg.extensions;

    std::optional<std::vector<std::string>> cli_exts;
    std::uint64_t max_batches = 1;

    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "", long_opts, nullptr)) != -1) {
        switch (c) {
            case kOptBatchSize:
                if (!ParseI64(optarg, opt.batch_size)) {
                    std::fprintf(stderr, "Invalid --batch-size: %s\n", optarg);
                    return kExitUsage;
                }
                break;
            case kOptSubdir:
                opt.subdir = optarg;
                break;
            case kOptReset:
                opt.reset = true;
                break;
            case kOptSeed: {
                std::uint64_t v{};
                if (!ParseU64(optarg, v)) {
                    std::fprintf(stderr, "Invalid --seed: %s\n", optarg);
                    return kExitUsage;
                }
                opt.seed = v;
                break;
            }
            case kOptExt:
                if (!cli_exts)
                    cli_exts.emplace();
                SplitExtensions(optarg, *cli_exts);
                break;
            case kOptOnError:
                if (auto r = arcnav::ParseErrorPolicy(optarg, opt.on_error); !r.is_ok()) {
                    std::fprintf(stderr, "%s\n", r.msg.c_str());
                    return kExitUsage;
                }
                break;
            case kOptMaxRetries: {
                std::int64_t v{};
                if (!ParseI64(optarg, v) || v < 0 || v > arcnav::kMaxRetriesLimit) {
                    std::fprintf(stderr, "Invalid --max-retries: %s\n", optarg);
                    return kExitUsage;
                }
                opt.max_retries = static_cast<int>(v);
                break;
            }
            case kOptValidateCrc:
                opt.validate_crc = true;
                break;
            case kOptMaxBatches:
                if (!ParseU64(optarg, max_batches)) {
                    std::fprintf(stderr, "Invalid --max-batches: %s\n", optarg);
                    return kExitUsage;
                }
                break;
            default:
                PrintUsage(ctx.prog);
                return kExitUsage;
        }
    }
    if (argc - optind != 1) {
        PrintUsage(ctx.prog);
        return kExitUsage;
    }
    if (cli_exts)
        opt.extensions = std::move(cli_exts);
    opt.output_dir = argv[optind];

    arcnav::BatchExtractor ex(ctx.view);
    ApplyPreflight(ctx, ex);
    if (auto r = ex.Initialize(opt); !r.is_ok())
        return Fail(r);
    return RunBatches(ex, max_batches);
}

// Shared by resume/status/reset: [--subdir S] [--max-batches N] <output_dir>.
int ParseStateCommand(ToolContext &ctx,
                      int argc,
                      char **argv,
                      bool allow_max_batches,
                      std::string &output_dir,
                      std::string &subdir,
                      std::uint64_t &max_batches) {
    static option long_opts[] = {
        {"subdir", required_argument, nullptr, 's'},
        {"max-batches", required_argument, nullptr, 'n'},
        {nullptr, 0, nullptr, 0},
    };

    subdir = ctx.cfg.extract_subdir.value_or("extracted_archive");
    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "", long_opts, nullptr)) != -1) {
        switch (c) {
            case 's':
                subdir = optarg;
                break;
            case 'n':
                if (!allow_max_batches || !ParseU64(optarg, max_batches)) {
                    std::fprintf(stderr, "Invalid --max-batches\n");
                    return kExitUsage;
                }
                break;
            default:
                PrintUsage(ctx.prog);
                return kExitUsage;
        }
    }
    if (argc - optind != 1) {
        PrintUsage(ctx.prog);
        return kExitUsage;
    }
    output_dir = argv[optind];
    return kExitOk;
}

int CmdResume(ToolContext &ctx, int argc, char **argv) {
    std::string out_dir;
    std::string subdir;
    std::uint64_t max_batches = 1;
    if (int rc = ParseStateCommand(ctx, argc, argv, true, out_dir, subdir, max_batches); rc != kExitOk)
        return rc;

    arcnav::BatchExtractor ex(ctx.view);
    ApplyPreflight(ctx, ex);
    if (auto r = ex.Resume(out_dir, subdir); !r.is_ok())
        return Fail(r);
    return RunBatches(ex, max_batches);
}

int CmdStatus(ToolContext &ctx, int argc, char **argv) {
    std::string out_dir;
    std::string subdir;
    std::uint64_t unused = 0;
    if (int rc = ParseStateCommand(ctx, argc, argv, false, out_dir, subdir, unused); rc != kExitOk)
        return rc;

    arcnav::BatchExtractor ex(ctx.view);
    if (auto r = ex.Resume(out_dir, subdir); !r.is_ok() && r.code != arcnav::ErrorCode::NotFound)
        return Fail(r);
    PrintJson(arcnav::StatusToJson(ex.Status()));
    return kExitOk;
}

int CmdReset(ToolContext &ctx, int argc, char **argv) {
    std::string out_dir;
    std::string subdir;
    std::uint64_t unused = 0;
    if (int rc = ParseStateCommand(ctx, argc, argv, false, out_dir, subdir, unused); rc != kExitOk)
        return rc;

    arcnav::BatchExtractor ex(ctx.view);
    if (auto r = ex.Resume(out_dir, subdir); !r.is_ok()) {
        if (r.code == arcnav::ErrorCode::NotFound) {
            std::fprintf(stderr, "nothing to reset\n");
            return kExitOk;
        }
        return Fail(r);
    }
    if (auto r = ex.Reset(); !r.is_ok())
        return Fail(r);
    return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
    arcnav::InstallSignalHandlers();

    std::string config_path = arcnav::config::kDefaultConfigPath;
    bool explicit_config = false;
    const char *cd = nullptr;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"cd", required_argument, nullptr, 'C'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // '+' stops at the archive argument so command options are left alone.
    int c;
    while ((c = getopt_long(argc, argv, "+c:C:vh", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'c':
                config_path = optarg;
                explicit_config = true;
                break;
            case 'C':
                cd = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (argc - optind < 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    ToolContext ctx;
    ctx.prog = argv[0];

    auto &logger = arcnav::Logger::Instance();
    if (auto r = ctx.cfg.LoadFile(config_path); !r.is_ok()) {
        if (explicit_config || r.code != arcnav::ErrorCode::NotFound) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitError;
        }
        LogDebug("no config at %s, using defaults", config_path.c_str());
    }
    if (ctx.cfg.log_level)
        logger.SetLevel(*ctx.cfg.log_level);
    logger.ApplyEnvironment();
    if (verbose)
        logger.SetLevel(arcnav::LogLevel::Debug);

    const char *archive_path = argv[optind];
    if (auto r = arcnav::ArchiveView::Open(archive_path, ctx.view); !r.is_ok())
        return Fail(r);

    if (cd) {
        std::string pwd;
        if (auto r = ctx.view.ChangeDirectory(cd, pwd); !r.is_ok())
            return Fail(r);
    }

    const std::string cmd = argv[optind + 1];
    const int sub_argc = argc - optind - 1;
    char **sub_argv = argv + optind + 1;

    if (cmd == "pwd")
        return CmdPwd(ctx, sub_argc, sub_argv);
    if (cmd == "ls")
        return CmdLs(ctx, sub_argc, sub_argv);
    if (cmd == "cat")
        return CmdCat(ctx, sub_argc, sub_argv);
    if (cmd == "info")
        return CmdInfo(ctx, sub_argc, sub_argv);
    if (cmd == "stat")
        return CmdStat(ctx, sub_argc, sub_argv);
    if (cmd == "extract")
        return CmdExtract(ctx, sub_argc, sub_argv);
    if (cmd == "resume")
        return CmdResume(ctx, sub_argc, sub_argv);
    if (cmd == "status")
        return CmdStatus(ctx, sub_argc, sub_argv);
    if (cmd == "reset")
        return CmdReset(ctx, sub_argc, sub_argv);

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    PrintUsage(argv[0]);
    return kExitUsage;
}
