#ifndef ACDC_UI_CLI_ACDCCLI_HPP
#define ACDC_UI_CLI_ACDCCLI_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/Container.hpp"
#include "acdc/core/EncodingPolicy.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace acdc::ui::cli
{

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitInvalid{ 1 };
constexpr int g_kExitUsage{ 2 };

class AcdcCli final
{
public:
    // `defaults` seeds --kind / --digest for `new`.
    AcdcCli(std::ostream& out, std::ostream& err, acdc::core::EncodingPolicy defaults);

    // `args` excludes the program name.
    int run(const std::vector<std::string>& args);

private:
    std::ostream& m_out;
    std::ostream& m_err;
    acdc::core::EncodingPolicy m_defaults;

    int doNew(const std::string& issuer, const std::string& registry, const std::string& schema,
              const std::string& attributesJson, const std::optional<std::string>& target, bool privateAttributes,
              const std::string& kindText, const std::string& digestText);
    int doVerify(const std::filesystem::path& file);
    int doShow(const std::filesystem::path& file);
    int doCompact(const std::filesystem::path& file, const std::string& block);
    int doExpand(const std::filesystem::path& file, const std::string& block, const std::string& dataJson);
    int doStore(const std::filesystem::path& db, const std::filesystem::path& file);
    int doChain(const std::filesystem::path& db, const std::filesystem::path& file);

    // Reads and fully verifies a container file; reports and returns std::nullopt on failure.
    std::optional<acdc::core::Container> loadContainer(const std::filesystem::path& file, int& exitCode);

    int reportError(acdc::core::AcdcError error);
    int reportUsage(const std::string& message);
    void writeContainer(const acdc::core::Container& container);
};

} // namespace acdc::ui::cli

#endif // ACDC_UI_CLI_ACDCCLI_HPP
