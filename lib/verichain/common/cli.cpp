/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <iostream>
#include "cli.hpp"
#include "timer.hpp"

namespace verichain::cli {
    using command_map_t = std::map<std::string, std::pair<command::ptr_t, config>>;

    static command_map_t &commands()
    {
        static command_map_t cmds {};
        return cmds;
    }

    void argument_config::expect(const std::initializer_list<std::string> names)
    {
        _names = names;
        _min = 0;
        _max = 0;
        for (const auto &name: _names) {
            if (name.ends_with("...]") || name.ends_with("...")) {
                _max.reset();
            } else if (name.starts_with('[')) {
                if (_max)
                    ++(*_max);
            } else {
                ++_min;
                if (_max)
                    ++(*_max);
            }
        }
    }

    void argument_config::validate(const arguments &args) const
    {
        if (args.size() < _min) [[unlikely]]
            throw error(fmt::format("expected at least {} arguments but got {}", _min, args.size()));
        if (_max && args.size() > *_max) [[unlikely]]
            throw error(fmt::format("expected at most {} arguments but got {}", *_max, args.size()));
    }

    std::string config::usage() const
    {
        std::string res = fmt::format("usage: vchain {}", name);
        for (const auto &[opt_name, opt]: opts)
            res += fmt::format(" [--{}=<value>]", opt_name);
        for (const auto &arg_name: args.names())
            res += fmt::format(" {}", arg_name);
        res += fmt::format("\n  {}", desc);
        for (const auto &[opt_name, opt]: opts) {
            res += fmt::format("\n  --{}: {}", opt_name, opt.desc);
            if (opt.default_value)
                res += fmt::format(" (default: {})", *opt.default_value);
        }
        return res;
    }

    bool command::reg(const ptr_t &cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name!");
        auto name = cfg.name;
        const auto [it, created] = commands().try_emplace(std::move(name), cmd, std::move(cfg));
        if (!created) [[unlikely]]
            throw error(fmt::format("a duplicate command name: {}", it->first));
        return true;
    }

    static void print_help()
    {
        std::cerr << "usage: vchain <command> [<option> ...] [<argument> ...]\ncommands:\n";
        for (const auto &[name, cmd]: commands())
            std::cerr << fmt::format("  {}: {}\n", name, cmd.second.desc);
    }

    static std::pair<arguments, options> parse(const config &cfg, const int argc, const char **argv)
    {
        arguments args {};
        options opts {};
        for (int i = 2; i < argc; ++i) {
            const std::string_view arg { argv[i] };
            if (!arg.starts_with("--")) {
                args.emplace_back(arg);
                continue;
            }
            auto name = arg.substr(2);
            std::optional<std::string> val {};
            if (const auto eq_pos = name.find('='); eq_pos != std::string_view::npos) {
                val.emplace(name.substr(eq_pos + 1));
                name = name.substr(0, eq_pos);
            } else if (i + 1 < argc) {
                val.emplace(argv[++i]);
            }
            if (!cfg.opts.contains(std::string { name })) [[unlikely]]
                throw error(fmt::format("an unsupported option: --{}\n{}", name, cfg.usage()));
            if (!val) [[unlikely]]
                throw error(fmt::format("the option --{} requires a value", name));
            opts[std::string { name }] = std::move(val);
        }
        for (const auto &[name, opt]: cfg.opts) {
            if (!opts.contains(name))
                opts.try_emplace(name, opt.default_value);
        }
        cfg.args.validate(args);
        return std::make_pair(std::move(args), std::move(opts));
    }

    int run(const int argc, const char **argv)
    {
        try {
            if (argc < 2) {
                print_help();
                return 1;
            }
            const std::string cmd_name { argv[1] };
            const auto it = commands().find(cmd_name);
            if (it == commands().end()) {
                logger::error("unknown command: {}", cmd_name);
                print_help();
                return 1;
            }
            const auto &[cmd, cfg] = it->second;
            const auto [args, opts] = parse(cfg, argc, argv);
            const timer t { fmt::format("vchain {}", cmd_name), logger::level::debug };
            cmd->run(args, opts);
            return 0;
        } catch (const std::exception &ex) {
            logger::error("Terminating due to an exception: {}", ex.what());
            return 1;
        } catch (...) {
            logger::error("Terminating due to an unknown exception");
            return 2;
        }
    }
}
