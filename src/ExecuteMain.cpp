//
// ExecuteMain.cpp — one harness step from the command line
//
//   board_execute --genesis --backend ID [--lane L] [--max-players N] --out FILE
//   board_execute --in FILE --out FILE
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "core/Exception.hpp"
#include "harness/Execute.hpp"
#include "wire/codec.hpp"

namespace
{
    struct ExecuteConfig
    {
        bool genesis{false};
        std::string backend;
        std::string lane;
        std::uint32_t max_players{board::core::constants::MaxPlayers};
        std::string in_path;
        std::string out_path;
    };

    auto ParseArgs(int argc, char** argv) -> std::optional<ExecuteConfig>
    {
        ExecuteConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            bool ok = true;
            if (arg == "--genesis") { cfg.genesis = true; }
            else if (arg == "--backend") { ok = next_str(cfg.backend); }
            else if (arg == "--lane") { ok = next_str(cfg.lane); }
            else if (arg == "--in") { ok = next_str(cfg.in_path); }
            else if (arg == "--out") { ok = next_str(cfg.out_path); }
            else if (arg == "--max-players")
            {
                std::uint64_t v{};
                ok = next_uint(v) && v > 0 && v <= board::core::constants::MaxPlayers;
                if (ok) { cfg.max_players = static_cast<std::uint32_t>(v); }
            }
            else
            {
                fmt::print("[board_execute] unknown argument '{}'\n", arg);
                return std::nullopt;
            }

            if (!ok)
            {
                fmt::print("[board_execute] bad value for '{}'\n", arg);
                return std::nullopt;
            }
        }

        if (cfg.out_path.empty()) return std::nullopt;
        if (cfg.genesis && cfg.backend.empty()) return std::nullopt;
        if (!cfg.genesis && cfg.in_path.empty()) return std::nullopt;
        return cfg;
    }

    auto ReadFile(std::string const& path) -> std::vector<std::uint8_t>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            BRD_THROW(board::core::error::Code::Io, fmt::format("cannot open '{}'", path));
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    auto WriteFile(std::string const& path, std::vector<std::uint8_t> const& bytes) -> void
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            BRD_THROW(board::core::error::Code::Io, fmt::format("cannot create '{}'", path));
        out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out)
            BRD_THROW(board::core::error::Code::Io, fmt::format("short write to '{}'", path));
    }

    auto Usage() -> void
    {
        fmt::print("usage: board_execute --genesis --backend ID [--lane L] [--max-players N] --out FILE\n"
                   "       board_execute --in FILE --out FILE\n");
    }
}

int main(int argc, char** argv)
{
    using namespace board::core;

    auto const cfg = ParseArgs(argc, argv);
    if (!cfg)
    {
        Usage();
        return 2;
    }

    try
    {
        if (cfg->genesis)
        {
            Config game_cfg{};
            game_cfg.max_players = cfg->max_players;
            auto const blob = harness::MakeGenesis(cfg->backend, cfg->lane, game_cfg);
            WriteFile(cfg->out_path, blob);
            fmt::print("[board_execute] genesis for backend '{}' lane '{}' ({} bytes)\n",
                       cfg->backend, cfg->lane, blob.size());
            return 0;
        }

        auto const input = ReadFile(cfg->in_path);
        auto const output = harness::Execute(wire::AsBytes(input));
        WriteFile(cfg->out_path, output);

        auto const outcome = harness::DecodeExecuteOutput(wire::AsBytes(output));
        if (!outcome)
        {
            fmt::print("[board_execute] produced unreadable output: {}\n", outcome.error().message);
            return 1;
        }

        if (outcome->violation)
        {
            fmt::print("[board_execute] rejected: {}\n", outcome->violation->message);
            return 3;
        }

        fmt::print("[board_execute] applied, phase {} round {}, {} event(s)\n",
                   PhaseName(outcome->state->phase), outcome->state->round, outcome->events.size());
        for (GameEvent const& e : outcome->events)
        {
            fmt::print("  {}\n", EventName(e));
        }
        return 0;
    }
    catch (error::IoError const& e)
    {
        fmt::print("{}", static_cast<OmegaException<error::Code> const&>(e));
        return 1;
    }
}
