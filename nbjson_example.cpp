/***
$ printf '{"name": "Elvis", "albums": [1956, 1957.5], "alive": null}' | ./nbjson_example
{
  "name": "Elvis",
  "albums": [
    1956,
    1957.5
  ],
  "alive": null
}

$ printf '["Elvis", 132]' | ./nbjson_example --events
StartArray
ValueString Elvis
ValueInt 132
EndArray
Eof

$ printf '["Elvis",]' | SPDLOG_LEVEL=debug ./nbjson_example
[nbjson] [debug] parse error at byte 9: Expected a value
[nbjson] [error] invalid JSON at byte 9: Expected a value
 ***/

#include "nbjson_parser.hpp"
#include "nbjson_pretty_printer.hpp"

#include <magic_enum.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace
{

constexpr std::size_t chunk_size = 64;

void print_event(
    std::ostream& out,
    const nbjson::event e,
    const nbjson::parser& parser)
{
    out << magic_enum::enum_name(e);

    switch (e)
    {
    case nbjson::event::FieldName:
    case nbjson::event::ValueString:
    case nbjson::event::ValueInt:
    case nbjson::event::ValueDouble:
        out << ' ' << parser.value().raw();
        break;
    default:
        break;
    }

    out << '\n';
}

int run(
    std::istream& in,
    std::ostream& out,
    const bool events,
    const std::size_t max_depth,
    const std::shared_ptr<spdlog::logger>& log)
{
    nbjson::parser parser(max_depth);
    parser.set_logger(log);

    nbjson::pretty_printer printer;

    std::array<char, chunk_size> chunk {};
    std::size_t chunk_length = 0;
    std::size_t chunk_offset = 0;

    nbjson::event e;
    do
    {
        while ((e = parser.next_event()) == nbjson::event::NeedMoreInput)
        {
            if (chunk_offset == chunk_length)
            {
                in.read(chunk.data(), chunk.size());
                chunk_length = static_cast<std::size_t>(in.gcount());
                chunk_offset = 0;

                if (chunk_length == 0)
                {
                    if (in.bad())
                    {
                        log->error("cannot read input");
                        return 2;
                    }
                    parser.feeder().done();
                    continue;
                }
            }

            chunk_offset += parser.feeder().feed(
                chunk.data() + chunk_offset,
                chunk_length - chunk_offset);
        }

        if (e == nbjson::event::Error)
        {
            const nbjson::parse_error& error = parser.error().value();
            log->error(
                "invalid JSON at byte {}: {}",
                error.offset(),
                error.what());
            return 1;
        }

        if (events)
        {
            print_event(out, e, parser);
        }
        else
        {
            printer.on_event(e, parser);
        }
    } while (e != nbjson::event::Eof);

    if (!events)
    {
        out << printer.result() << std::endl;
    }

    log->debug("parsed {} bytes", parser.parsed_bytes());

    return 0;
}

void usage(const char* program)
{
    std::cerr << program << " [--events] [--max-depth N] [FILE]" << std::endl;
}

// Accepts decimal numbers greater than zero, nothing else
bool parse_max_depth(const std::string_view arg, std::size_t& max_depth)
{
    std::size_t result = 0;
    const char* const end = arg.data() + arg.size();
    const auto [parse_end, error] = std::from_chars(arg.data(), end, result);
    if (error != std::errc() || parse_end != end || result == 0)
    {
        return false;
    }

    max_depth = result;
    return true;
}

} // namespace {anonymous}

int main(int argc, char* argv[])
{
    spdlog::cfg::load_env_levels();

    auto log = spdlog::stderr_color_mt("nbjson");
    log->set_pattern("[%n] [%^%l%$] %v");

    bool events = false;
    std::size_t max_depth = NBJ_DEFAULT_MAX_DEPTH;
    std::string filename;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg(argv[i]);

            if (arg == "--events")
            {
                events = true;
            }
            else if (arg == "--max-depth" && i + 1 < argc)
            {
                if (!parse_max_depth(argv[++i], max_depth))
                {
                    log->error("invalid --max-depth: {}", argv[i]);
                    usage(*argv);
                    return 2;
                }
            }
            else if (filename.empty() && arg.substr(0, 2) != "--")
            {
                filename = arg;
            }
            else
            {
                usage(*argv);
                return 2;
            }
        }

        if (filename.empty())
        {
            return run(std::cin, std::cout, events, max_depth, log);
        }

        std::ifstream file(filename, std::ios::binary);
        if (!file)
        {
            log->error("cannot open {}", filename);
            return 2;
        }

        return run(file, std::cout, events, max_depth, log);
    }
    catch (const std::exception& e)
    {
        log->critical("{}", e.what());
        return 2;
    }
}
