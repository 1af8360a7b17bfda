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
#include <xmss/fixture.hpp>
#include <xmss/guest_io.hpp>
#include <xmss/parameter_set.hpp>
#include <xmss/util/color.hpp>
#include <xmss/util/log.hpp>
#include <xmss/util/mpz.hpp>

using json = nlohmann::json;

using namespace xmss;
namespace fs = std::filesystem;

/************************************************************
 * Arguments:
 *     [1]: <json> Host command
 *
 *     { "command": "gen-input", "signatures": 4, "tree-height": 2,
 *       "w": 4, "v": 8, "d0": 12, "epoch": 0,
 *       "message": "...", "output": "input.json" }
 *
 *     { "command": "gen-fail", "output": "input.json" }
 *
 *     { "command": "check", "input": "input.json", "revealed": "output.json" }
 *
 *     { "command": "params" }
 ************************************************************/

namespace {

const std::string default_message = "xmss-batch-message";

int gen_input(const json& jconfig) {
    params p;
    p.w = jconfig.value("w", u16(4));
    p.v = jconfig.value("v", u16(8));
    p.d0 = jconfig.value("d0", u32(12));
    p.security_bits = 128;
    p.tree_height = jconfig.value("tree-height", u16(2));

    if (!p.valid()) {
        XMSS_LOG_ERROR << "Invalid parameters: w=" << p.w << ", v=" << p.v << ", d0=" << p.d0;
        return EXIT_FAILURE;
    }

    const u32 num_signatures = jconfig.value("signatures", 1u);
    const u64 epoch = jconfig.value("epoch", u64(0));
    const std::string message = jconfig.value("message", default_message);
    const fs::path output = jconfig.value("output", std::string("input.json"));

    const bytes m(message.begin(), message.end());
    const verification_batch batch = fixture::make_batch(p, num_signatures, m, epoch);
    guest_io::write_batch(output, batch);

    std::cout << "Generated " << num_signatures << " signatures at " << output << std::endl;
    return EXIT_SUCCESS;
}

int gen_fail(const json& jconfig) {
    const fs::path output = jconfig.value("output", std::string("input.json"));
    guest_io::write_batch(output, fixture::make_failing_batch());

    std::cout << "Wrote " << output << std::endl;
    return EXIT_SUCCESS;
}

int check(const json& jconfig) {
    const fs::path input = jconfig.value("input", std::string("input.json"));
    const fs::path revealed = jconfig.value("revealed", std::string("output.json"));

    const verification_batch batch = guest_io::read_batch(input);
    const guest_io::output_words words = guest_io::read_output_file(revealed);

    const u32 valid = words[guest_io::valid_word];
    const u32 count = words[guest_io::count_word];
    const u32 expect_k = batch.statement.k;

    std::cout << "valid=" << valid << ", count=" << count << ", k=" << expect_k << std::endl;

    if (count != expect_k) {
        std::cout << ANSI_RED << "FAIL: " << ANSI_RESET
                  << "num_verified should equal k in statement" << std::endl;
        return EXIT_FAILURE;
    }

    const digest_t expected = statement_commitment(batch.statement);
    const digest_t actual = guest_io::commitment_from_words(words);
    if (expected != actual) {
        std::cout << ANSI_RED << "FAIL: " << ANSI_RESET << "statement commitment mismatch" << std::endl
                  << "  revealed: " << guest_io::to_hex(actual) << std::endl
                  << "  expected: " << guest_io::to_hex(expected) << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << ANSI_GREEN << "OK: " << ANSI_RESET
              << "count and statement commitment verified" << std::endl;
    return EXIT_SUCCESS;
}

int show_params() {
    for (parameter_set set : all_parameter_sets) {
        const parameter_metadata meta = metadata(set);
        const params p = to_params(set);
        const mpz_class layer = layer_size_exact(p.w, p.v, p.d0);

        std::cout << ANSI_BOLDWHITE << instantiation_type(set) << ANSI_RESET << std::endl
                  << "  lifetime:        " << meta.lifetime << std::endl
                  << "  tree height:     " << meta.tree_height << std::endl
                  << "  winternitz:      " << meta.winternitz_parameter << std::endl
                  << "  hash:            " << meta.hash_function << std::endl
                  << "  signature bytes: " << meta.signature_size_bytes << std::endl
                  << "  public key bytes:" << meta.public_key_size_bytes << std::endl
                  << "  encoding:        w=" << p.w << ", v=" << p.v << ", d0=" << p.d0 << std::endl
                  << "  layer size:      " << layer.get_str()
                  << " (" << mpz_sizeinbase(layer.get_mpz_t(), 2) << " bits)" << std::endl;

        if (auto small = mpz_to_u64(layer); small && *small != 0) {
            std::cout << "  index wrap:      2^64 mod layer = "
                      << static_cast<u64>((u128(1) << 64) % *small) << std::endl;
        }
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, const char *argv[]) {
    if (argc < 2) {
        std::cerr << "Error: No JSON input provided" << std::endl;
        exit(EXIT_FAILURE);
    }

    std::string_view jstr = argv[1];

    try {
        const json jconfig = json::parse(jstr);

        if (auto level = parse_log_level(jconfig.value("log-level", std::string("info")))) {
            set_logging_level(*level);
        }

        const std::string command = jconfig.value("command", std::string());
        if (command == "gen-input") {
            return gen_input(jconfig);
        }
        else if (command == "gen-fail") {
            return gen_fail(jconfig);
        }
        else if (command == "check") {
            return check(jconfig);
        }
        else if (command == "params") {
            return show_params();
        }
        else {
            std::cerr << "Invalid command: " << jconfig.dump() << std::endl;
            return EXIT_FAILURE;
        }
    }
    catch (json::exception& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (codec_error& e) {
        XMSS_LOG_ERROR << e.what();
        return EXIT_FAILURE;
    }
    catch (std::invalid_argument& e) {
        XMSS_LOG_ERROR << e.what();
        return EXIT_FAILURE;
    }
    catch (fs::filesystem_error& e) {
        XMSS_LOG_ERROR << e.what();
        return EXIT_FAILURE;
    }
}
