// ====================================================================================
// RAIN META INSPECTOR (rainmeta-inspect)
//
// Decodes a Rain meta document (raw bytes or hex text) and prints every item with
// its content negotiation fields, hashes and a typed payload summary.
// ====================================================================================

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "rainmeta/rainmeta.hpp"

using namespace rainmeta::v1;

// --- Forward Declarations for Printing ---
void PrintUsage();
void PrintHeader(const std::string& title);
void PrintSummary(const std::filesystem::path& path, const byte_vec& bytes, size_t item_count);
void PrintItem(size_t index, const MetaDocumentItem& item);
void PrintTypedPayload(const MetaDocumentItem& item);

// Files holding hex text ("0x..." or bare) are decoded, anything else is taken as raw bytes.
rainmeta::util::StatusOr<byte_vec> LoadMetaBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return rainmeta::util::Status::NotFound("cannot open " + path.string());
    byte_vec raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::string text(raw.begin(), raw.end());
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.pop_back();
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    text = text.substr(start);

    auto decoded = rainmeta::util::HexDecode(text);
    if (!text.empty() && decoded.ok()) return decoded;
    return raw;
}

// --- Main Application Logic ---

int main(int argc, char* argv[]) {
    if (argc != 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        PrintUsage();
        return EXIT_SUCCESS;
    }

    std::filesystem::path file_path = argv[1];
    if (!std::filesystem::exists(file_path)) {
        std::cerr << "Error: File not found: " << file_path << std::endl;
        return EXIT_FAILURE;
    }

    ApplyLoggingConfig(Config::FromEnvironment());

    std::cout << "=========================================" << std::endl;
    std::cout << " RAIN META DOCUMENT INSPECTOR" << std::endl;
    std::cout << "=========================================" << std::endl;

    auto bytes_or = LoadMetaBytes(file_path);
    if (!bytes_or.ok()) {
        std::cerr << "\n[ERROR] " << bytes_or.status().ToString() << std::endl;
        return EXIT_FAILURE;
    }
    const byte_vec& bytes = bytes_or.value();

    auto items_or = MetaDocumentItem::CborDecode(bytes);
    if (!items_or.ok()) {
        std::cerr << "\n[ERROR] Failed to decode meta: " << items_or.status().ToString() << std::endl;
        if (!HasMagicPrefix(bytes, KnownMagic::kRainMetaDocumentV1)) {
            std::cerr << "Hint: the input does not start with the rain-meta-document-v1 magic." << std::endl;
        }
        return EXIT_FAILURE;
    }

    PrintSummary(file_path, bytes, items_or.value().size());
    for (size_t i = 0; i < items_or.value().size(); ++i) PrintItem(i, items_or.value()[i]);

    std::cout << "\n--- Inspection Complete ---" << std::endl;
    return EXIT_SUCCESS;
}

// --- Implementation of Printing Functions ---

void PrintUsage() {
    std::cout << "Rain Meta Inspector (rainmeta-inspect)" << std::endl;
    std::cout << "Displays the items of a Rain meta document sequence." << std::endl;
    std::cout << "\nUSAGE:" << std::endl;
    std::cout << "  rainmeta-inspect <path_to_meta>" << std::endl;
    std::cout << "\nThe file may hold raw bytes or hex text, with or without a 0x prefix." << std::endl;
    std::cout << "\nOPTIONS:" << std::endl;
    std::cout << "  -h, --help    Show this help message." << std::endl;
    std::cout << "\nENVIRONMENT:" << std::endl;
    std::cout << "  RAINMETA_LOG_LEVEL, RAINMETA_LOG_FILE" << std::endl;
}

void PrintHeader(const std::string& title) {
    const size_t fill = title.length() < 60 ? 60 - title.length() : 4;
    std::cout << "\n--- " << title << " " << std::string(fill, '-') << std::endl;
}

void PrintSummary(const std::filesystem::path& path, const byte_vec& bytes, size_t item_count) {
    PrintHeader("Document Summary");
    std::cout << std::left;
    std::cout << "  " << std::setw(20) << "File Path:" << path << std::endl;
    std::cout << "  " << std::setw(20) << "Meta Size:" << bytes.size() << " bytes" << std::endl;
    std::cout << "  " << std::setw(20) << "Prefixed:"
              << (HasMagicPrefix(bytes, KnownMagic::kRainMetaDocumentV1) ? "yes" : "no") << std::endl;
    std::cout << "  " << std::setw(20) << "Meta Hash:" << rainmeta::util::HexEncode(ToBytes(Keccak256(bytes)))
              << std::endl;
    std::cout << "  " << std::setw(20) << "Items:" << item_count << std::endl;
}

const char* OrNone(const char* text) {
    return *text == '\0' ? "(none)" : text;
}

void PrintItem(size_t index, const MetaDocumentItem& item) {
    PrintHeader("Item " + std::to_string(index) + " (" + MagicName(item.magic) + ")");
    std::cout << std::left;
    std::cout << "  " << std::setw(20) << "Magic:" << "0x" << std::hex << ToU64(item.magic) << std::dec << std::endl;
    std::cout << "  " << std::setw(20) << "Content Type:" << OrNone(ContentTypeToString(item.content_type)) << std::endl;
    std::cout << "  " << std::setw(20) << "Content Encoding:" << OrNone(ContentEncodingToString(item.content_encoding))
              << std::endl;
    std::cout << "  " << std::setw(20) << "Content Language:" << OrNone(ContentLanguageToString(item.content_language))
              << std::endl;
    std::cout << "  " << std::setw(20) << "Payload:" << item.payload.size() << " bytes" << std::endl;
    std::cout << "  " << std::setw(20) << "Item Hash:" << rainmeta::util::HexEncode(ToBytes(item.ItemHash())) << std::endl;
    std::cout << "  " << std::setw(20) << "Document Hash:" << rainmeta::util::HexEncode(ToBytes(item.DocumentHash()))
              << std::endl;
    PrintTypedPayload(item);
}

void PrintTypedPayload(const MetaDocumentItem& item) {
    if (item.magic == KnownMagic::kRainMetaDocumentV1) {
        std::cout << "  " << std::setw(20) << "Typed:" << "(nested meta document)" << std::endl;
        return;
    }
    auto typed_or = TypedMetaFromItem(item);
    if (!typed_or.ok()) {
        std::cout << "  " << std::setw(20) << "Typed:" << "(" << typed_or.status().ToString() << ")" << std::endl;
        return;
    }
    std::cout << "  " << std::setw(20) << "Typed:";
    std::visit([](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, AuthoringMeta>) {
            std::cout << arg.items.size() << " words" << std::endl;
            for (const auto& word : arg.items) {
                std::cout << "    - " << std::setw(24) << word.word << word.description << std::endl;
            }
        } else if constexpr (std::is_same_v<T, AuthoringMetaV2>) {
            std::cout << arg.items.size() << " words" << std::endl;
        } else if constexpr (std::is_same_v<T, DotrainSource>) {
            std::cout << arg.text.size() << " chars, source hash "
                      << rainmeta::util::HexEncode(ToBytes(arg.Hash())) << std::endl;
        } else if constexpr (std::is_same_v<T, DotrainGuiState>) {
            std::cout << "deployment '" << arg.selected_deployment << "', " << arg.field_values.size()
                      << " fields, " << arg.select_tokens.size() << " tokens" << std::endl;
        } else if constexpr (std::is_same_v<T, OpMeta>) {
            std::cout << arg.ops.size() << " opcodes" << std::endl;
        } else if constexpr (std::is_same_v<T, SolidityAbiMeta>) {
            std::cout << arg.abi.size() << " abi fragments" << std::endl;
        } else if constexpr (std::is_same_v<T, InterpreterCallerMeta>) {
            std::cout << "caller '" << arg.meta.value("name", std::string()) << "'" << std::endl;
        } else if constexpr (std::is_same_v<T, ExpressionDeployerBytecodeMeta>) {
            std::cout << arg.bytecode.size() << " bytes of bytecode" << std::endl;
        } else if constexpr (std::is_same_v<T, AddressListMeta>) {
            std::cout << arg.packed.size() / 20 << " addresses" << std::endl;
        } else {
            std::cout << arg.text.size() << " chars of text" << std::endl;
        }
    }, typed_or.value());
}
