#include "AcdcCli.hpp"

#include "acdc/core/Attestation.hpp"
#include "acdc/core/ChainValidator.hpp"
#include "acdc/core/Compaction.hpp"
#include "acdc/core/Said.hpp"
#include "acdc/resolver/sqlite/SqliteContainerStoreFactory.hpp"

#include <CLI/CLI.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace acdc::ui::cli
{
namespace
{

[[nodiscard]] std::optional<acdc::core::Bytes> readFile(const std::filesystem::path& file)
{
    std::ifstream in{ file, std::ios::binary };
    if (!in)
    {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string text{ buffer.str() };

    // A JSON container saved from a terminal usually ends with a newline that is not part of it.
    if (!text.empty() && text.front() == '{')
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        {
            text.pop_back();
        }
    }
    return acdc::core::Bytes(text.begin(), text.end());
}

[[nodiscard]] std::optional<acdc::core::Document> parseJsonArgument(const std::string& text)
{
    acdc::core::Document doc = acdc::core::Document::parse(text, nullptr, false);
    if (doc.is_discarded())
    {
        return std::nullopt;
    }
    return std::optional<acdc::core::Document>{ std::in_place, std::move(doc) };
}

} // namespace

AcdcCli::AcdcCli(std::ostream& out, std::ostream& err, acdc::core::EncodingPolicy defaults)
    : m_out(out), m_err(err), m_defaults(defaults)
{
}

int AcdcCli::run(const std::vector<std::string>& args)
{
    std::vector<std::string> fullArgs;
    fullArgs.reserve(args.size() + 1);
    fullArgs.emplace_back("acdc");
    fullArgs.insert(fullArgs.end(), args.begin(), args.end());

    CLI::App app{ "Authentic chained data containers" };
    app.require_subcommand(1);

    int exitCode{ g_kExitOk };

    // NEW
    std::string issuer;
    std::string registry;
    std::string schema;
    std::string attributesJson;
    std::string target;
    bool privateAttributes{ false };
    std::string kindText;
    std::string digestText;
    auto* subNew = app.add_subcommand("new", "Create a container and print it");
    subNew->add_option("--issuer", issuer, "Issuer identifier")->required();
    subNew->add_option("--schema", schema, "Schema SAID")->required();
    subNew->add_option("--registry", registry, "Registry identifier");
    subNew->add_option("--attributes", attributesJson, "Attribute data as a JSON object")->required();
    auto* targetOpt = subNew->add_option("--target", target, "Issuee identifier");
    subNew->add_flag("--private", privateAttributes, "Salted, self-addressed attribute block");
    subNew->add_option("--kind", kindText, "JSON, CBOR or MGPK");
    subNew->add_option("--digest", digestText, "Digest code: E, F, G, H or I");
    subNew->callback(
        [&]()
        {
            const std::optional<std::string> targetArg{ targetOpt->count() > 0U ? std::optional<std::string>{ target }
                                                                                 : std::nullopt };
            exitCode =
                doNew(issuer, registry, schema, attributesJson, targetArg, privateAttributes, kindText, digestText);
        });

    // VERIFY
    std::string fileArg;
    auto* subVerify = app.add_subcommand("verify", "Verify the SAID of an encoded container");
    subVerify->add_option("file", fileArg, "Container file")->required();
    subVerify->callback([&]() { exitCode = doVerify(fileArg); });

    // SHOW
    auto* subShow = app.add_subcommand("show", "Print the fields of a verified container");
    subShow->add_option("file", fileArg, "Container file")->required();
    subShow->callback([&]() { exitCode = doShow(fileArg); });

    // COMPACT
    std::string blockArg;
    auto* subCompact = app.add_subcommand("compact", "Replace a block with its SAID");
    subCompact->add_option("file", fileArg, "Container file")->required();
    subCompact->add_option("--block", blockArg, "Block label: a, e or r")->required();
    subCompact->callback([&]() { exitCode = doCompact(fileArg, blockArg); });

    // EXPAND
    std::string dataArg;
    auto* subExpand = app.add_subcommand("expand", "Disclose a compact block");
    subExpand->add_option("file", fileArg, "Container file")->required();
    subExpand->add_option("--block", blockArg, "Block label: a, e or r")->required();
    subExpand->add_option("--data", dataArg, "Full block content as JSON")->required();
    subExpand->callback([&]() { exitCode = doExpand(fileArg, blockArg, dataArg); });

    // STORE
    std::string dbArg;
    auto* subStore = app.add_subcommand("store", "Add a verified container to an SQLite store");
    subStore->add_option("db", dbArg, "Store database file")->required();
    subStore->add_option("file", fileArg, "Container file")->required();
    subStore->callback([&]() { exitCode = doStore(dbArg, fileArg); });

    // CHAIN
    auto* subChain = app.add_subcommand("chain", "Validate the edge chain against an SQLite store");
    subChain->add_option("db", dbArg, "Store database file")->required();
    subChain->add_option("file", fileArg, "Container file")->required();
    subChain->callback([&]() { exitCode = doChain(dbArg, fileArg); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(fullArgs.size());
        for (const auto& arg : fullArgs)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
        return g_kExitOk;
    }
    catch (const CLI::ParseError& e)
    {
        return reportUsage(e.what());
    }
    catch (const std::runtime_error& e)
    {
        m_err << "error: " << e.what() << "\n";
        return g_kExitUsage;
    }
    return exitCode;
}

// --- Handlers ---

int AcdcCli::doNew(const std::string& issuer, const std::string& registry, const std::string& schema,
                   const std::string& attributesJson, const std::optional<std::string>& target,
                   bool privateAttributes, const std::string& kindText, const std::string& digestText)
{
    acdc::core::EncodingPolicy policy{ m_defaults };
    if (!kindText.empty())
    {
        const auto kind{ acdc::core::parseSerializationKind(kindText) };
        if (!kind)
        {
            return reportUsage("unknown serialization kind: " + kindText);
        }
        policy.kind = *kind;
    }
    if (!digestText.empty())
    {
        const auto code{ acdc::core::parseDigestCode(digestText) };
        if (!code)
        {
            return reportUsage("unknown digest code: " + digestText);
        }
        policy.code = *code;
    }

    const auto data{ parseJsonArgument(attributesJson) };
    if (!data || !data->is_object())
    {
        return reportUsage("--attributes must be a JSON object");
    }

    acdc::core::AttestationOptions options{};
    options.target = target;
    options.privateAttributes = privateAttributes;

    const auto result{ acdc::core::newContainer(issuer, registry, schema, *data, options, policy) };
    if (acdc::core::isError(result))
    {
        return reportError(acdc::core::errorOf(result));
    }
    writeContainer(std::get<acdc::core::Container>(result));
    return g_kExitOk;
}

int AcdcCli::doVerify(const std::filesystem::path& file)
{
    const auto bytes{ readFile(file) };
    if (!bytes)
    {
        return reportUsage("cannot read " + file.string());
    }
    if (const auto parsed{ acdc::core::parse(*bytes) }; acdc::core::isError(parsed))
    {
        return reportError(acdc::core::errorOf(parsed));
    }
    m_out << "ok\n";
    return g_kExitOk;
}

int AcdcCli::doShow(const std::filesystem::path& file)
{
    int exitCode{ g_kExitOk };
    const auto container{ loadContainer(file, exitCode) };
    if (!container)
    {
        return exitCode;
    }

    m_out << "identifier: " << container->identifier() << "\n";
    m_out << "issuer: " << container->issuer() << "\n";
    m_out << "schema: " << container->schema() << "\n";
    m_out << "registry: " << container->registry() << "\n";

    const auto& attributes{ container->attributesBlock() };
    if (attributes.has_value())
    {
        if (const auto* compact{ std::get_if<acdc::core::CompactBlock>(&*attributes) }; compact != nullptr)
        {
            m_out << "attributes: compact " << compact->said << "\n";
        }
        else
        {
            m_out << "attributes: " << std::get<acdc::core::Document>(*attributes).dump() << "\n";
        }
    }

    const auto& edges{ container->edges() };
    if (edges.has_value())
    {
        if (const auto* compact{ std::get_if<acdc::core::CompactBlock>(&*edges) }; compact != nullptr)
        {
            m_out << "edges: compact " << compact->said << "\n";
        }
        else
        {
            for (const auto& edge : std::get<acdc::core::EdgeSet>(*edges).edges)
            {
                m_out << "edge " << edge.label << ": " << edge.ref.targetIdentifier << " "
                      << acdc::core::edgeOperatorName(edge.ref.effectiveOperator()) << "\n";
            }
        }
    }
    return g_kExitOk;
}

int AcdcCli::doCompact(const std::filesystem::path& file, const std::string& block)
{
    const auto label{ acdc::core::blockLabelFromKey(block) };
    if (!label)
    {
        return reportUsage("unknown block label: " + block);
    }

    int exitCode{ g_kExitOk };
    const auto container{ loadContainer(file, exitCode) };
    if (!container)
    {
        return exitCode;
    }

    const auto result{ acdc::core::compactBlock(*container, *label) };
    if (acdc::core::isError(result))
    {
        return reportError(acdc::core::errorOf(result));
    }
    writeContainer(std::get<acdc::core::Container>(result));
    return g_kExitOk;
}

int AcdcCli::doExpand(const std::filesystem::path& file, const std::string& block, const std::string& dataJson)
{
    const auto label{ acdc::core::blockLabelFromKey(block) };
    if (!label)
    {
        return reportUsage("unknown block label: " + block);
    }
    const auto data{ parseJsonArgument(dataJson) };
    if (!data)
    {
        return reportUsage("--data is not valid JSON");
    }

    int exitCode{ g_kExitOk };
    const auto container{ loadContainer(file, exitCode) };
    if (!container)
    {
        return exitCode;
    }

    const auto result{ acdc::core::expandBlock(*container, *label, *data) };
    if (acdc::core::isError(result))
    {
        return reportError(acdc::core::errorOf(result));
    }
    writeContainer(std::get<acdc::core::Container>(result));
    return g_kExitOk;
}

int AcdcCli::doStore(const std::filesystem::path& db, const std::filesystem::path& file)
{
    const auto bytes{ readFile(file) };
    if (!bytes)
    {
        return reportUsage("cannot read " + file.string());
    }

    auto store{ acdc::resolver::sqlite::makeSqliteContainerStore(db) };
    const auto stored{ store->put(*bytes) };
    if (acdc::core::isError(stored))
    {
        return reportError(acdc::core::errorOf(stored));
    }
    m_out << std::get<std::string>(stored) << "\n";
    return g_kExitOk;
}

int AcdcCli::doChain(const std::filesystem::path& db, const std::filesystem::path& file)
{
    int exitCode{ g_kExitOk };
    const auto container{ loadContainer(file, exitCode) };
    if (!container)
    {
        return exitCode;
    }

    auto store{ acdc::resolver::sqlite::makeSqliteContainerStore(db) };
    const auto result{ acdc::core::validateChain(*container, *store) };
    if (result.valid)
    {
        m_out << "valid\n";
        return g_kExitOk;
    }

    m_err << "error: " << acdc::core::toString(result.error.value_or(acdc::core::AcdcError::OperatorUnsatisfied));
    if (!result.failingIdentifier.empty())
    {
        m_err << " at " << result.failingIdentifier;
    }
    if (!result.failingEdge.empty())
    {
        m_err << " via edge " << result.failingEdge;
    }
    m_err << "\n";
    return g_kExitInvalid;
}

// --- Helpers ---

std::optional<acdc::core::Container> AcdcCli::loadContainer(const std::filesystem::path& file, int& exitCode)
{
    const auto bytes{ readFile(file) };
    if (!bytes)
    {
        exitCode = reportUsage("cannot read " + file.string());
        return std::nullopt;
    }

    auto parsed{ acdc::core::parse(*bytes) };
    if (acdc::core::isError(parsed))
    {
        exitCode = reportError(acdc::core::errorOf(parsed));
        return std::nullopt;
    }
    return std::move(std::get<acdc::core::Container>(parsed));
}

int AcdcCli::reportError(acdc::core::AcdcError error)
{
    m_err << "error: " << acdc::core::toString(error) << "\n";
    return g_kExitInvalid;
}

int AcdcCli::reportUsage(const std::string& message)
{
    m_err << "usage error: " << message << "\n";
    return g_kExitUsage;
}

void AcdcCli::writeContainer(const acdc::core::Container& container)
{
    const acdc::core::Bytes bytes{ container.encode() };
    m_out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (container.version().kind == acdc::core::SerializationKind::Json)
    {
        m_out << "\n";
    }
}

} // namespace acdc::ui::cli
