// ====================================================================================
// RAIN META DEMO (rainmeta-demo)
//
// Generates MetaBoard deployment data for a dotrain source, then indexes the same
// source in a Store and resolves it again through an in-memory resolver.
//
// USAGE: rainmeta-demo [-i input.rain] [-o output.json]
// ====================================================================================

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>

#include "rainmeta/rainmeta.hpp"

using namespace rainmeta::v1;

// A robust helper for checking status results in main.
void CheckStatus(const rainmeta::util::Status& status, const std::string& context) {
    if (!status.ok()) {
        std::cerr << "[FATAL ERROR] " << context << ": " << status.ToString() << std::endl;
        exit(EXIT_FAILURE);
    }
}

// Serves meta bytes from a local table, standing in for a subgraph client.
class InMemoryResolver final : public MetadataResolver {
public:
    void Publish(const byte_vec& bytes) { metas_[rainmeta::util::HexEncode(ToBytes(Keccak256(bytes)))] = bytes; }

    rainmeta::util::StatusOr<MetaResponse> Query(const std::string& hash, const std::string& endpoint) override {
        auto it = metas_.find(hash);
        if (it == metas_.end()) return rainmeta::util::Status::NotFound(hash + " not on " + endpoint);
        return MetaResponse{it->second};
    }

    rainmeta::util::StatusOr<DeployerResponse> QueryDeployer(const std::string& hash, const std::string& endpoint) override {
        return rainmeta::util::Status::NotFound("no deployers on " + endpoint + " for " + hash);
    }

private:
    std::map<std::string, byte_vec> metas_;
};

const char* kSampleDotrain = R"(---
#calculate-io
max-amount: 100e18,
price: 2e18;

#handle-io
:;
)";

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_path;
    for (int i = 1; i + 1 < argc; i += 2) {
        const std::string flag = argv[i];
        if (flag == "-i" || flag == "--input-path") input_path = argv[i + 1];
        else if (flag == "-o" || flag == "--output-path") output_path = argv[i + 1];
    }

    Config config = Config::FromEnvironment();
    config.store.include_default_subgraphs = false;
    config.store.subgraphs = {"memory://primary", "memory://mirror"};
    ApplyLoggingConfig(config);

    std::cout << "--- Rain Meta Demo ---" << std::endl;

    // --- 1. Load the dotrain source ---
    std::string content = kSampleDotrain;
    if (!input_path.empty()) {
        std::ifstream file(input_path);
        if (!file) CheckStatus(rainmeta::util::Status::NotFound(input_path), "Opening input");
        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    // --- 2. Generate deployment data ---
    auto deployment_or = GenerateDotrainDeployment(content);
    CheckStatus(deployment_or.status(), "Generating deployment data");
    const std::string json = deployment_or.value().ToJson().dump(2);
    if (output_path.empty()) {
        std::cout << json << std::endl;
    } else {
        std::ofstream out(output_path);
        out << json << std::endl;
        if (!out) CheckStatus(rainmeta::util::Status::Error("write failed"), "Writing " + output_path);
        std::cout << "Deployment data written to " << output_path << std::endl;
    }

    // --- 3. Index the source locally ---
    Store store = Store::FromConfig(config);
    const auto dotrain = store.SetDotrain(content, "file:///demo.rain", false);
    std::cout << "Indexed dotrain " << rainmeta::util::HexEncode(dotrain.first) << std::endl;

    // --- 4. Resolve the published sequence through the resolver ---
    auto resolver = std::make_shared<InMemoryResolver>();
    auto meta_or = rainmeta::util::HexDecode(deployment_or.value().meta_bytes);
    CheckStatus(meta_or.status(), "Decoding meta bytes");
    resolver->Publish(meta_or.value());
    store.SetResolver(resolver);

    auto subject_or = rainmeta::util::HexDecode(deployment_or.value().subject);
    CheckStatus(subject_or.status(), "Decoding subject");
    auto resolved = store.UpdateCheck(subject_or.value());
    if (!resolved) CheckStatus(rainmeta::util::Status::NotFound("subject"), "Resolving published meta");

    auto typed_or = ParseFromHex(rainmeta::util::HexEncode(*resolved.value()));
    CheckStatus(typed_or.status(), "Parsing resolved meta");
    std::cout << "Resolved " << typed_or.value().size() << " item(s), cache now holds " << store.cache().size()
              << " entries" << std::endl;

    std::cout << "\n--- Demo Complete ---" << std::endl;
    return EXIT_SUCCESS;
}
