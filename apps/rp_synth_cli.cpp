// SPDX-License-Identifier: Apache-2.0
// Part of RelayPlane (RP) project.
// apps/rp_synth_cli.cpp

#include "rp/synthesizer.hpp"
#include "rp/log.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/internal/memory_store.hpp"
#include "rp/internal/sni.hpp"
#include "rp/internal/validator.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --fleet <snapshot.json> [--node <id>] [--mode legacy|v1|dual]\n"
      "      [--sync_group <id>] [--rotate_inbound <id>]\n"
      "      [--pin_sni <host>] [--checker <bin>|none] [--out <file>] [--save 0|1] [--pretty 0|1]\n"
      "\n"
      "  --node            synthesize the node's document and print hash + document\n"
      "  --sync_group      materialize the group's templates on every member first\n"
      "  --rotate_inbound  give one template-backed inbound a new port and SNI first\n"
      "  --pin_sni         camouflage domain for --node (and its rotations)\n"
      "  --checker         engine binary for `check -c` (default sing-box; none = skip)\n"
      "  --out             write the document there instead of stdout\n"
      "  --save            write fleet mutations (ports, keys, templates) back to --fleet\n";
}

int main(int argc, char** argv) {
    std::string fleet, mode, checker = "sing-box", out_path, pin_sni;
    long long node_id = 0, group_id = 0, inbound_id = 0;
    bool save = false, pretty = true;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--fleet" && i+1 < argc) fleet = argv[++i];
            else if (a == "--node" && i+1 < argc) node_id = std::stoll(argv[++i]);
            else if (a == "--mode" && i+1 < argc) mode = argv[++i];
            else if (a == "--sync_group" && i+1 < argc) group_id = std::stoll(argv[++i]);
            else if (a == "--rotate_inbound" && i+1 < argc) inbound_id = std::stoll(argv[++i]);
            else if (a == "--pin_sni" && i+1 < argc) pin_sni = argv[++i];
            else if (a == "--checker" && i+1 < argc) checker = argv[++i];
            else if (a == "--out" && i+1 < argc) out_path = argv[++i];
            else if (a == "--save" && i+1 < argc) save = (std::stoi(argv[++i]) != 0);
            else if (a == "--pretty" && i+1 < argc) pretty = (std::stoi(argv[++i]) != 0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    if (fleet.empty() || (node_id == 0 && group_id == 0 && inbound_id == 0)) {
        usage(argv[0]);
        return 2;
    }

    // Diagnostics go to the log file only; stdout carries the document.
    rp::set_log_stdout(false);

    rp::internal::MemoryStore store;
    if (!store.init_file(fleet)) {
        std::cerr << "[FATAL] cannot load fleet snapshot " << fleet << "\n";
        return 1;
    }

    rp::internal::PinnedSniProvider sni;
    if (!pin_sni.empty() && node_id != 0) sni.pin(node_id, pin_sni);
    std::unique_ptr<rp::internal::ConfigValidator> validator;
    if (checker == "none") validator = std::make_unique<rp::internal::NullValidator>();
    else validator = std::make_unique<rp::internal::EngineValidator>(checker);

    rp::SynthOptions opt;
    if (!mode.empty()) opt.relay_auth_mode = rp::relay_auth_mode_from_setting(mode);
    rp::Synthesizer synth(store, sni, *validator, opt);

    try {
        if (group_id != 0) {
            std::size_t n = synth.sync_group(group_id);
            std::cerr << "sync_group " << group_id << ": " << n << " endpoint(s)\n";
        }
        if (inbound_id != 0) {
            if (!synth.rotate_inbound(inbound_id)) {
                std::cerr << "rotate_inbound " << inbound_id << ": failed (see log)\n";
                return 1;
            }
            std::cerr << "rotate_inbound " << inbound_id << ": ok\n";
        }
        if (node_id != 0) {
            rp::Document doc = synth.synthesize(node_id);
            const std::string text = rp::internal::write_json(doc.root, pretty);
            std::cerr << "hash " << doc.hash << "\n";
            if (out_path.empty()) {
                std::cout << text << "\n";
            } else {
                std::ofstream out(out_path, std::ios::out | std::ios::trunc);
                out << text << "\n";
                if (!out.good()) {
                    std::cerr << "[FATAL] cannot write " << out_path << "\n";
                    return 1;
                }
            }
        }
    } catch (const rp::ValidationError& e) {
        std::cerr << "[FATAL] validation failed:\n" << e.output() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }

    if (save && !store.save_file(fleet)) {
        std::cerr << "[FATAL] cannot save fleet snapshot " << fleet << "\n";
        return 1;
    }
    return 0;
}
