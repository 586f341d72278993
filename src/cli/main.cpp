#include <iostream>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <chrono>
#include <memory>
#include <utility>
#include <filesystem> // For std::filesystem::exists

#include "cxxopts.hpp"
#include <nlohmann/json.hpp>
#include "bato_core/chapter_resolver.h"
#include "bato_core/page_fetcher.h"
#include "bato_core/password_evaluator.h"
#include "bato_core/resolve_error.h"
#include "bato_core/url_utils.h"

namespace bato_core {

void to_json(nlohmann::json& j, const PageImageEntry& page) {
    j = nlohmann::json{
        {"id", page.id()},
        {"url", page.url()}
    };
}

} // namespace bato_core

// Reads a saved chapter page from disk.
static bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return static_cast<bool>(in) || in.eof();
}

static void printPages(const bato_core::ChapterPageSet& pages, bool asJson) {
    if (asJson) {
        nlohmann::json j = pages.pages;
        std::cout << j.dump(2) << std::endl;
        return;
    }
    for (const auto& page : pages.pages) {
        std::cout << page.url() << std::endl;
    }
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("bato-cli", "Resolves the page image URLs of a Batoto chapter\nVersion 0.1.0");
    options.set_width(100);
    options.add_options()
        ("h,help", "Print usage")
        ("u,url", "Chapter URL or site-relative path (e.g. /chapter/123456)", cxxopts::value<std::string>())
        ("f,file", "Read the chapter page from a saved HTML file instead of fetching it", cxxopts::value<std::string>())
        ("d,domain", "Site domain used for relative paths", cxxopts::value<std::string>()->default_value(bato_core::kDefaultDomain))
        ("e,evaluator", "Password expression evaluator: duktape, node or literal",
                        cxxopts::value<std::string>()->default_value("duktape"))
        ("node", "node binary used by the 'node' evaluator", cxxopts::value<std::string>()->default_value("node"))
        ("t,timeout", "Evaluator timeout in milliseconds", cxxopts::value<long>()->default_value("5000"))
        ("j,json", "Print pages as a JSON array of {id, url}", cxxopts::value<bool>()->default_value("false"))
    ;
    options.positional_help("<chapter_url>");
    options.parse_positional({"url"});

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception& e) { // cxxopts parse errors
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for more information." << std::endl;
        return 2;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    if (!result.count("url") && !result.count("file")) {
        std::cerr << "Error: a chapter URL (-u) or a saved page (-f) is required." << std::endl;
        std::cerr << "Use --help for more information." << std::endl;
        return 2;
    }

    std::string domain = result["domain"].as<std::string>();
    if (!bato_core::isValidDomain(domain)) {
        std::cerr << "Error: '" << domain << "' is not a valid domain name." << std::endl;
        return 2;
    }

    long timeoutMs = result["timeout"].as<long>();
    if (timeoutMs <= 0) {
        std::cerr << "Error: --timeout must be positive." << std::endl;
        return 2;
    }

    bato_core::EvaluatorOptions evalOptions;
    evalOptions.timeout = std::chrono::milliseconds(timeoutMs);
    evalOptions.nodePath = result["node"].as<std::string>();

    std::string backend = result["evaluator"].as<std::string>();
    std::unique_ptr<bato_core::PasswordEvaluator> evaluator = bato_core::makeEvaluator(backend, evalOptions);
    if (!evaluator) {
        std::cerr << "Error: unknown evaluator '" << backend << "'. Use 'duktape', 'node' or 'literal'." << std::endl;
        return 2;
    }

    std::string pageText;
    if (result.count("file")) {
        std::string path = result["file"].as<std::string>();
        if (!std::filesystem::exists(path)) {
            std::cerr << "Error: file '" << path << "' does not exist." << std::endl;
            return 1;
        }
        if (!readFile(path, pageText)) {
            std::cerr << "Error: could not read '" << path << "'." << std::endl;
            return 1;
        }
    } else {
        std::string url = result["url"].as<std::string>();
        std::cerr << "Fetching chapter page: " << bato_core::toAbsoluteUrl(domain, url) << "..." << std::endl;

        bato_core::PageFetcher fetcher(domain);
        auto page = fetcher.fetchPage(url);
        if (!page) {
            std::cerr << "Error: Failed to fetch the chapter page. Possible reasons:" << std::endl;
            std::cerr << "  - Network issue (check internet connection)." << std::endl;
            std::cerr << "  - Invalid chapter URL or wrong --domain." << std::endl;
            return 1;
        }
        pageText = std::move(*page);
    }

    bato_core::ChapterResolver resolver(*evaluator);
    try {
        bato_core::ChapterPageSet pages = resolver.resolve(pageText);
        std::cerr << "Resolved " << pages.size() << " page(s) using the " << evaluator->name() << " evaluator." << std::endl;
        printPages(pages, result["json"].as<bool>());
    } catch (const bato_core::ResolveError& e) {
        std::cerr << "Error [" << bato_core::errorKindName(e.kind()) << "] " << e.what() << std::endl;
        if (e.kind() == bato_core::ErrorKind::ExtractionFailed) {
            std::cerr << "  The site's page format may have changed." << std::endl;
        }
        return 1;
    }

    return 0;
}
