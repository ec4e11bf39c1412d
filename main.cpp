#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "application/ReviewSession.hpp"
#include "application/ReviewSynthesizer.hpp"
#include "application/SuggestionApplicator.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/CredentialStores.hpp"
#include "infrastructure/CritiqueJson.hpp"
#include "infrastructure/FileTextDocument.hpp"
#include "infrastructure/ProviderResolver.hpp"
#include "infrastructure/RateLimiter.hpp"

using namespace draftlens;
using nlohmann::json;

namespace {

constexpr const char* kVersion = "0.1.0";

bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[DraftLens] Could not open " << path << std::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

bool readJson(const std::string& path, json& out) {
    std::string text;
    if (!readFile(path, text)) return false;
    try {
        out = json::parse(text);
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[DraftLens] Invalid JSON in " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool writeOutput(const json& j, const std::optional<std::string>& outputPath) {
    if (!outputPath) {
        std::cout << j.dump(2) << std::endl;
        return true;
    }
    std::ofstream file(*outputPath);
    if (!file.is_open()) {
        std::cerr << "[DraftLens] Could not write " << *outputPath << std::endl;
        return false;
    }
    file << j.dump(2) << std::endl;
    std::cout << "[DraftLens] Wrote " << *outputPath << std::endl;
    return true;
}

/** Accepts both "--ids a --ids b" and "--ids a,b". */
std::vector<std::string> splitIds(const std::vector<std::string>& values) {
    std::vector<std::string> ids;
    for (const auto& value : values) {
        std::stringstream stream(value);
        std::string id;
        while (std::getline(stream, id, ',')) {
            if (!id.empty()) ids.push_back(id);
        }
    }
    return ids;
}

infrastructure::AppConfig loadConfig(const argparse::ArgumentParser& command) {
    std::string path = infrastructure::ConfigLoader::DefaultSettingsPath();
    if (auto custom = command.present("--config")) path = *custom;
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(path);
    for (const auto& error : infrastructure::ConfigLoader::Validate(config)) {
        std::cerr << "[DraftLens] Configuration: " << error << std::endl;
    }
    return config;
}

std::shared_ptr<domain::CredentialStore> makeCredentialStore() {
    std::vector<std::shared_ptr<domain::CredentialStore>> stores;
    stores.push_back(std::make_shared<infrastructure::EnvCredentialStore>());
    stores.push_back(
        std::make_shared<infrastructure::JsonFileCredentialStore>(infrastructure::JsonFileCredentialStore::DefaultPath()));
    return std::make_shared<infrastructure::ChainedCredentialStore>(std::move(stores));
}

int runReview(const argparse::ArgumentParser& command,
              const std::shared_ptr<infrastructure::RateLimiterRegistry>& registry) {
    json analysisJson;
    if (!readJson(command.get<std::string>("--analysis"), analysisJson)) return 1;
    domain::DiffAnalysis analysis = infrastructure::CritiqueJson::DiffAnalysisFromJson(analysisJson);

    std::optional<std::string> filePath = command.present("--file");
    std::optional<std::string> fullText;
    std::optional<int> documentVersion;
    if (filePath) {
        try {
            auto document = infrastructure::FileTextDocument::Open(*filePath);
            fullText = document->content();
            documentVersion = document->version();
        } catch (const std::exception& e) {
            std::cerr << "[DraftLens] " << e.what() << std::endl;
            return 1;
        }
    }

    application::ReviewSynthesizer synthesizer(nullptr, [](std::string status) {
        std::cout << "[DraftLens] " << status << std::endl;
    });

    if (!command.get<bool>("--offline")) {
        infrastructure::AppConfig config = loadConfig(command);
        auto credentials = makeCredentialStore();
        application::InitializationResult init = synthesizer.initialize(config, *credentials, registry);
        if (init.status == infrastructure::ResolutionStatus::CredentialMissing) {
            std::cout << "[DraftLens] No credential for provider '" << init.providerId
                      << "'; using rule-based review." << std::endl;
        } else if (!init.ready()) {
            std::cerr << "[DraftLens] Provider '" << init.providerId << "' unavailable: " << init.message << std::endl;
        }
    }

    domain::Critique critique = synthesizer.generateReview(analysis, filePath, fullText, documentVersion);
    const auto& provenance = synthesizer.lastProvenance();
    if (provenance.fromBackend) {
        std::cout << "[DraftLens] Model " << provenance.modelId << ", " << provenance.tokenUsage.totalTokens
                  << " tokens, estimated cost $" << provenance.tokenUsage.estimatedCost << std::endl;
    }
    std::cout << "[DraftLens] Rating " << critique.rating << "/10, " << critique.suggestions.size()
              << " suggestion(s)" << std::endl;

    return writeOutput(infrastructure::CritiqueJson::ToJson(critique), command.present("--output")) ? 0 : 1;
}

int runApply(const argparse::ArgumentParser& command) {
    json critiqueJson;
    if (!readJson(command.get<std::string>("--critique"), critiqueJson)) return 1;

    domain::Critique critique;
    try {
        critique = infrastructure::CritiqueJson::CritiqueFromJson(critiqueJson);
    } catch (const std::exception& e) {
        std::cerr << "[DraftLens] Invalid critique: " << e.what() << std::endl;
        return 1;
    }

    infrastructure::AppConfig config = loadConfig(command);
    auto host = std::make_shared<infrastructure::FileEditorHost>();
    std::shared_ptr<infrastructure::FileTextDocument> document;
    try {
        // Absolute, so critiques recorded with either form of the path pass the target-file check.
        std::filesystem::path target = std::filesystem::absolute(command.get<std::string>("--file"));
        document = host->open(target.lexically_normal().string());
    } catch (const std::exception& e) {
        std::cerr << "[DraftLens] " << e.what() << std::endl;
        return 1;
    }

    application::SuggestionApplicator applicator(host, std::chrono::milliseconds(config.apply.settleDelayMs));
    application::ReviewSession session(std::move(critique));

    auto onProgress = [](int index, int total, const domain::Suggestion& s) {
        std::cout << "[DraftLens] Applying " << index << "/" << total << " (line " << s.displayLine << ")"
                  << std::endl;
    };

    auto ids = splitIds(command.get<std::vector<std::string>>("--ids"));
    application::BatchApplyResult batch =
        ids.empty() ? session.applyRemaining(applicator, onProgress) : session.applySelected(ids, applicator, onProgress);

    for (const auto& result : batch.results) {
        if (result.success) continue;
        std::cerr << "[DraftLens] " << result.suggestionId << ": "
                  << application::ApplyOutcomeToString(result.outcome) << " - " << result.message << std::endl;
    }
    std::cout << "[DraftLens] Applied " << batch.successCount << ", failed " << batch.failureCount << std::endl;

    if (batch.successCount > 0 && !document->save()) {
        std::cerr << "[DraftLens] Failed to save " << document->path() << std::endl;
        return 1;
    }
    return batch.failureCount == 0 ? 0 : 2;
}

int runAnalyzeDiff(const argparse::ArgumentParser& command,
                   const std::shared_ptr<infrastructure::RateLimiterRegistry>& registry) {
    std::string diffText;
    if (!readFile(command.get<std::string>("--diff"), diffText)) return 1;

    infrastructure::AppConfig config = loadConfig(command);
    auto credentials = makeCredentialStore();
    infrastructure::ProviderResolver resolver(registry);
    infrastructure::ProviderResolution resolution = resolver.resolve(config, *credentials);
    if (!resolution.isReady()) {
        std::cerr << "[DraftLens] Provider '" << resolution.providerId << "' not available ("
                  << infrastructure::ResolutionStatusToString(resolution.status) << ")";
        if (!resolution.message.empty()) std::cerr << ": " << resolution.message;
        std::cerr << std::endl;
        return 1;
    }

    domain::AnalysisContext context;
    context.filePath = command.present("--file");
    if (context.filePath) {
        context.documentType = application::ReviewSynthesizer::DocumentTypeFor(context.filePath);
    }

    try {
        auto response = resolution.adapter->analyzeDiff(diffText, context);
        std::cout << "[DraftLens] Model " << response.modelId << ", " << response.tokenUsage.totalTokens
                  << " tokens" << std::endl;
        return writeOutput(infrastructure::CritiqueJson::ToJson(response.data), command.present("--output")) ? 0 : 1;
    } catch (const domain::BackendError& e) {
        std::cerr << "[DraftLens] " << domain::BackendErrorCodeToString(e.code()) << ": " << e.what() << std::endl;
        return 1;
    }
}

} // namespace

int main(int argc, char** argv) {
    argparse::ArgumentParser program("draftlens", kVersion);

    argparse::ArgumentParser review_command("review");
    review_command.add_description("Produce a critique for a revision");
    review_command.add_argument("--analysis").help("diff analysis JSON").required().metavar("PATH");
    review_command.add_argument("--file").help("current document content").metavar("PATH");
    review_command.add_argument("--config").help("settings.json to use").metavar("PATH");
    review_command.add_argument("--output").help("write the critique here instead of stdout").metavar("PATH");
    review_command.add_argument("--offline")
        .help("skip the reasoning backend and use the rule-based review")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser apply_command("apply");
    apply_command.add_description("Apply critique suggestions to a document");
    apply_command.add_argument("--critique").help("critique JSON produced by review").required().metavar("PATH");
    apply_command.add_argument("--file").help("document to edit").required().metavar("PATH");
    apply_command.add_argument("--config").help("settings.json to use").metavar("PATH");
    apply_command.add_argument("--ids")
        .help("suggestion ids to apply; all remaining suggestions when omitted")
        .default_value<std::vector<std::string>>({})
        .append()
        .metavar("ID");

    argparse::ArgumentParser analyze_command("analyze-diff");
    analyze_command.add_description("Ask the reasoning backend to analyze a unified diff");
    analyze_command.add_argument("--diff").help("unified diff").required().metavar("PATH");
    analyze_command.add_argument("--file").help("document the diff applies to").metavar("PATH");
    analyze_command.add_argument("--config").help("settings.json to use").metavar("PATH");
    analyze_command.add_argument("--output").help("write the analysis here instead of stdout").metavar("PATH");

    program.add_subparser(review_command);
    program.add_subparser(apply_command);
    program.add_subparser(analyze_command);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    auto registry = std::make_shared<infrastructure::RateLimiterRegistry>();

    if (program.is_subcommand_used("review")) {
        return runReview(review_command, registry);
    } else if (program.is_subcommand_used("apply")) {
        return runApply(apply_command);
    } else if (program.is_subcommand_used("analyze-diff")) {
        return runAnalyzeDiff(analyze_command, registry);
    }

    std::cerr << program;
    return 1;
}
