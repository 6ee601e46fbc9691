//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `sshconf` command-line tool.  Every command reads one
// configuration file, parses it, and then either prints it back (cat), lists
// its malformed entries (check), shows the parsed structure (dump) or confirms
// that printing the parsed file reproduces the input byte for byte (verify).
// The driver takes its streams and SourceManager as parameters so tests can
// run it in-process.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Command parsing and command implementations for `sshconf`.

#include "tools/sshconf/cli.hpp"

#include "sshconf/analysis/Check.hpp"
#include "sshconf/core/File.hpp"
#include "sshconf/io/FileIO.hpp"
#include "sshconf/io/Parser.hpp"
#include "sshconf/io/Serializer.hpp"
#include "sshconf/io/StringEscape.hpp"
#include "sshconf/version.hpp"

#include <algorithm>
#include <array>
#include <sstream>

namespace sshconf::tools
{
namespace
{
using support::Diag;
using support::Severity;

constexpr std::array<std::string_view, 4> kCommands = {"cat", "check", "dump", "verify"};

bool isCommand(std::string_view name)
{
    return std::find(kCommands.begin(), kCommands.end(), name) != kCommands.end();
}

/// @brief Emit a stage note when --trace is active.
void trace(const support::Options &opts,
           std::ostream &err,
           const support::SourceManager &sm,
           uint32_t fileId,
           std::string message)
{
    if (!opts.trace)
        return;
    support::printDiag(Diag{Severity::Note, std::move(message), {fileId, 0, 0}}, err, &sm);
}

std::string quoted(std::string_view text)
{
    return "\"" + io::encodeEscapedString(text) + "\"";
}

int runCat(const core::File &file, std::ostream &out)
{
    io::Serializer::write(file, out);
    return 0;
}

/// @brief Report malformed entries; strict mode makes them errors.
int runCheck(const core::File &file,
             const Invocation &inv,
             uint32_t fileId,
             std::ostream &out,
             std::ostream &err,
             const support::SourceManager &sm)
{
    support::DiagnosticEngine de;
    const Severity severity = inv.options.strict ? Severity::Error : Severity::Warning;
    const std::size_t malformed = analysis::checkFile(file, fileId, de, severity);
    de.printAll(err, &sm);
    if (malformed == 0)
        out << "OK\n";
    return de.errorCount() == 0 ? 0 : 1;
}

int runDump(const core::File &file, std::ostream &out)
{
    for (std::size_t i = 0; i < file.lines.size(); ++i)
        out << (i + 1) << ": " << describeLine(file.lines[i]) << '\n';
    return 0;
}

/// @brief Compare the serialized file against the bytes it was parsed from.
int runVerify(const core::File &file,
              const std::string &text,
              uint32_t fileId,
              std::ostream &out,
              std::ostream &err,
              const support::SourceManager &sm)
{
    const auto line = firstMismatchLine(file, text);
    if (!line)
    {
        out << "OK\n";
        return 0;
    }
    support::SourceLoc loc{fileId, static_cast<uint32_t>(*line), 0};
    support::printDiag(support::makeError(loc, "round-trip mismatch"), err, &sm);
    return 1;
}
} // namespace

support::Expected<Invocation> parseArgs(ArgvView args)
{
    Invocation inv;
    for (; !args.empty(); args = args.drop_front())
    {
        const std::string_view arg = args.front();
        if (arg == "--trace")
            inv.options.trace = true;
        else if (arg == "--strict")
            inv.options.strict = true;
        else if (arg == "--version")
            inv.showVersion = true;
        else if (arg == "--help" || arg == "-h")
            inv.showHelp = true;
        else if (arg.starts_with("-"))
            return support::makeError({}, "unknown option '" + std::string(arg) + "'");
        else if (inv.command.empty())
            inv.command = arg;
        else if (inv.path.empty())
            inv.path = arg;
        else
            return support::makeError({}, "unexpected argument '" + std::string(arg) + "'");
    }

    if (inv.showHelp || inv.showVersion)
        return inv;
    if (inv.command.empty())
        return support::makeError({}, "missing command");
    if (!isCommand(inv.command))
        return support::makeError({}, "unknown command '" + inv.command + "'");
    if (inv.path.empty())
        return support::makeError({}, "missing file operand for '" + inv.command + "'");
    return inv;
}

void printUsage(std::ostream &os)
{
    os << "Usage: sshconf [--trace] [--strict] <command> <file>\n"
          "Commands:\n"
          "  cat     print the file as parsed\n"
          "  check   report malformed entries\n"
          "  dump    print the parsed structure of each line\n"
          "  verify  self-check that the parsed file prints back byte for byte\n"
          "Options:\n"
          "  --trace    print a note for each processing step\n"
          "  --strict   treat malformed entries as errors\n"
          "  --version  print the version and exit\n"
          "  --help     print this text and exit\n";
}

std::optional<std::size_t> firstMismatchLine(const core::File &file, std::string_view original)
{
    const std::string printed = io::Serializer::toString(file);
    if (printed == original)
        return std::nullopt;
    const auto mismatch =
        std::mismatch(original.begin(), original.end(), printed.begin(), printed.end());
    return static_cast<std::size_t>(1 + std::count(original.begin(), mismatch.first, '\n'));
}

std::string describeLine(const core::Line &line)
{
    std::ostringstream os;
    const core::Expression &e = line.expression;
    os << core::kindName(e.kind);
    switch (e.kind)
    {
        case core::Expression::Kind::Options:
            os << " keyword=" << quoted(e.keyword) << " separator=" << quoted(e.separator)
               << " arguments=[";
            for (std::size_t i = 0; i < e.arguments.size(); ++i)
            {
                if (i != 0)
                    os << ", ";
                os << core::kindName(e.arguments[i].kind) << ' ' << quoted(e.arguments[i].text);
            }
            os << ']';
            break;
        case core::Expression::Kind::Comment:
        case core::Expression::Kind::Malformed:
            os << ' ' << quoted(e.text);
            break;
        case core::Expression::Kind::Empty:
            break;
    }
    if (!line.indentPrefix.empty())
        os << " prefix=" << quoted(line.indentPrefix);
    if (!line.indentSuffix.empty())
        os << " suffix=" << quoted(line.indentSuffix);
    if (line.ending == core::LineEnding::CrLf)
        os << " ending=crlf";
    else if (line.ending == core::LineEnding::None)
        os << " ending=none";
    return os.str();
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm)
{
    auto parsed = parseArgs(ArgvView{argc, argv}.drop_front());
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        printUsage(err);
        return 1;
    }
    const Invocation &inv = parsed.value();
    if (inv.showHelp)
    {
        printUsage(out);
        return 0;
    }
    if (inv.showVersion)
    {
        out << "sshconf " << SSHCONF_VERSION_STR << '\n';
        return 0;
    }

    const uint32_t fileId = sm.addFile(inv.path);
    if (fileId == 0)
    {
        support::printDiag(
            support::makeError({}, std::string(support::kSourceManagerFileIdOverflowMessage)), err);
        return 1;
    }

    auto text = io::readText(inv.path);
    if (!text)
    {
        support::printDiag(text.error(), err);
        return 1;
    }
    trace(inv.options, err, sm, fileId, "read " + std::to_string(text.value().size()) + " bytes");

    const core::File file = io::Parser::parse(text.value(), inv.path);
    trace(inv.options, err, sm, fileId, "parsed " + std::to_string(file.lines.size()) + " lines");

    if (inv.command == "cat")
        return runCat(file, out);
    if (inv.command == "check")
        return runCheck(file, inv, fileId, out, err, sm);
    if (inv.command == "dump")
        return runDump(file, out);
    return runVerify(file, text.value(), fileId, out, err, sm);
}

} // namespace sshconf::tools
