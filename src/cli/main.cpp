#include <cstdio>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunkctl [--sock <path>] <command>\n"
                         "\n"
                         "Commands:\n"
                         "  health   OK once tasks are loaded, LOADING before\n"
                         "  status   task and peer counts\n"
                         "  quit     stop the server\n");
}

using Requester = std::function<std::optional<std::string>(const std::string &)>;

static int request(const std::string &sock, const Requester &send, const std::string &line,
                   std::string &reply)
{
    auto r = send(line);
    if (!r)
    {
        std::fprintf(stderr, "error: cannot reach chunkd at %s\n", sock.c_str());
        return exitc::no_server;
    }
    reply = *r;
    std::printf("%s\n", reply.c_str());
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args,
                   const std::string &sock, const Requester &send)
{
    std::string reply;
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"health",
         [&]() -> int {
             int rc = request(sock, send, "HEALTH", reply);
             if (rc != exitc::ok)
                 return rc;
             return reply == "OK" ? exitc::ok : exitc::not_ready;
         }},
        {"status", [&]() -> int { return request(sock, send, "STATUS", reply); }},
        {"quit", [&]() -> int { return request(sock, send, "QUIT", reply); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    if (args.size() != 1)
    {
        std::fprintf(stderr, "error: %s takes no arguments\n", cmd.c_str());
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    chunkfarm::set_log_level_by_name(std::getenv("CHUNKFARM_LOG_LEVEL"));
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // CHUNKFARM_CTL_SOCK (or the default), then --sock overrides
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                print_usage();
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    auto sender = [&](const std::string &line) { return ipc::request_line(sock, line); };
    return run_cmd(args[0], args, sock, sender);
}
