/*
 * Copyright (C) 2023-2026 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include <xmss/codec.hpp>
#include <xmss/commitment.hpp>
#include <xmss/guest_io.hpp>
#include <xmss/util/log.hpp>
#include <xmss/verifier.hpp>

using json = nlohmann::json;

using namespace xmss;
namespace fs = std::filesystem;

/************************************************************
 * Arguments:
 *     [1]: <json> Guest configuration
 *
 *     {
 *       "input":     "<path of input JSON>",
 *       "output":    "<path of revealed words JSON>",     (optional)
 *       "binding":   "epoch-message" | "signature-randomness",
 *       "log-level": "disabled" | "debug" | "info" | "full"
 *     }
 ************************************************************/

namespace {

bool reveal(const guest_io::output_words& words, const fs::path& output_path) {
    std::cout << guest_io::format_execution_output(words) << std::endl;

    if (!output_path.empty()) {
        try {
            guest_io::write_output_file(output_path, words);
        }
        catch (std::exception& e) {
            XMSS_LOG_ERROR << e.what();
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, const char *argv[]) {
    std::cout << "xmss-guest v"
              << XMSS_GUEST_VERSION_MAJOR << "."
              << XMSS_GUEST_VERSION_MINOR << "."
              << XMSS_GUEST_VERSION_PATCH << std::endl;

    if (argc < 2) {
        std::cerr << "Error: No JSON input provided" << std::endl;
        exit(EXIT_FAILURE);
    }

    std::string_view jstr = argv[1];

    log_level level = log_level::info_only;
    message_binding binding = message_binding::epoch_message;
    fs::path input_path;
    fs::path output_path;

    try {
        const json jconfig = json::parse(jstr);

        if (jconfig.contains("log-level")) {
            auto parsed = parse_log_level(jconfig["log-level"].template get<std::string>());
            if (!parsed) {
                std::cerr << "Invalid log-level: " << jconfig["log-level"].dump() << std::endl;
                exit(EXIT_FAILURE);
            }
            level = *parsed;
        }

        if (jconfig.contains("binding")) {
            auto parsed = parse_binding(jconfig["binding"].template get<std::string>());
            if (!parsed) {
                std::cerr << "Invalid binding: " << jconfig["binding"].dump() << std::endl;
                exit(EXIT_FAILURE);
            }
            binding = *parsed;
        }

        if (!jconfig.contains("input")) {
            std::cerr << "Error: Missing \"input\"" << std::endl;
            exit(EXIT_FAILURE);
        }
        input_path = jconfig["input"].template get<std::string>();

        if (jconfig.contains("output")) {
            output_path = jconfig["output"].template get<std::string>();
        }
    }
    catch (json::exception& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    set_logging_level(level);

    // Reading and decoding the batch
    // ------------------------------------------------------------
    verification_batch batch;
    try {
        batch = guest_io::read_batch(input_path);
    }
    catch (codec_error& e) {
        XMSS_LOG_ERROR << e.what();
        if (!reveal(guest_io::output_words{}, output_path))
            XMSS_LOG_ERROR << "Could not write revealed words";
        exit(EXIT_FAILURE);
    }

    XMSS_LOG_INFO << "Batch: k=" << batch.statement.k
                  << ", w=" << batch.params.w
                  << ", v=" << batch.params.v
                  << ", d0=" << batch.params.d0
                  << ", tree_height=" << batch.params.tree_height
                  << ", binding=" << binding_name(binding);

    // Verification
    // ------------------------------------------------------------
    const batch_result result = verify_batch(batch, binding);
    const digest_t commitment = statement_commitment(batch.statement);

    XMSS_LOG_INFO << "Verified " << result.count << " signatures, all_valid="
                  << result.all_valid;
    XMSS_LOG_DEBUG << "Statement commitment: " << guest_io::to_hex(commitment);

    return reveal(guest_io::make_output_words(result, commitment), output_path)
        ? EXIT_SUCCESS
        : EXIT_FAILURE;
}
