#include <iostream>
#include <string>
#include <cstdlib>
#include <exception>

#include "pcapgen.hpp"

void print_usage(const std::string& prog) {
    std::cout << "Usage:\n";
    std::cout << "  " << prog << " gen     <filename> <num_records> [options]\n";
    std::cout << "  " << prog << " verify  <filename>\n";
    std::cout << "  " << prog << " compare <file1> <file2>\n\n";
    std::cout << "gen options:\n";
    std::cout << "  --len N            captured bytes per packet (default 64)\n";
    std::cout << "  --len-max N        random lengths between --len and N\n";
    std::cout << "  --spacing-us N     microseconds between packets (default 1000)\n";
    std::cout << "  --gap I:SECONDS    insert an idle gap before packet I (negative jumps back)\n";
    std::cout << "  --ns               nanosecond timestamps\n";
    std::cout << "  --big-endian       big-endian headers\n";
    std::cout << "  --truncate N       chop N bytes off the end\n";
    std::cout << "  --seed N           seed for random lengths\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    try {
        if (cmd == "gen") {
            if (argc < 4) {
                print_usage(argv[0]);
                return 1;
            }
            std::string filename = argv[2];
            CaptureSpec spec;
            spec.num_records = std::stoull(argv[3]);

            for (int i = 4; i < argc; ++i) {
                std::string opt = argv[i];
                bool has_value = i + 1 < argc;
                if (opt == "--len" && has_value) {
                    spec.payload_len = static_cast<uint32_t>(std::stoul(argv[++i]));
                } else if (opt == "--len-max" && has_value) {
                    spec.payload_len_max = static_cast<uint32_t>(std::stoul(argv[++i]));
                } else if (opt == "--spacing-us" && has_value) {
                    spec.spacing_ns = std::stoull(argv[++i]) * 1000;
                } else if (opt == "--gap" && has_value) {
                    std::string v = argv[++i];
                    auto colon = v.find(':');
                    if (colon == std::string::npos) {
                        std::cerr << "--gap expects INDEX:SECONDS, got " << v << "\n";
                        return 1;
                    }
                    TimeJump jump;
                    jump.before_record = std::stoull(v.substr(0, colon));
                    jump.delta_ns = static_cast<int64_t>(std::stod(v.substr(colon + 1)) * 1e9);
                    spec.jumps.push_back(jump);
                } else if (opt == "--ns") {
                    spec.resolution = TsResolution::Nano;
                } else if (opt == "--big-endian") {
                    spec.order = ByteOrder::Big;
                } else if (opt == "--truncate" && has_value) {
                    spec.truncate_bytes = std::stoull(argv[++i]);
                } else if (opt == "--seed" && has_value) {
                    spec.seed = static_cast<unsigned>(std::stoul(argv[++i]));
                } else {
                    std::cerr << "Unknown or incomplete option: " << opt << "\n";
                    print_usage(argv[0]);
                    return 1;
                }
            }

            CaptureGenerator gen;
            GeneratedCapture cap = gen.generate(filename, spec);
            std::cout << "Generated file: " << filename << " with " << spec.num_records
                      << " packets (" << cap.file_size << " bytes)\n";
        }

        else if (cmd == "verify") {
            if (argc != 3) {
                print_usage(argv[0]);
                return 1;
            }
            uint64_t records = verify_pcap_file(argv[2]);
            std::cout << "Verification PASSED! Total records: " << records << std::endl;
        }

        else if (cmd == "compare") {
            if (argc != 4) {
                print_usage(argv[0]);
                return 1;
            }
            if (!compare_files(argv[2], argv[3])) return 1;
            std::cout << "File comparison PASSED!" << std::endl;
        }

        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}


/* ## Example Usage ##

# 1000 packets, 1 ms apart, with a two hour pause before packet 500
./pcapgen gen gap.pcap 1000 --gap 500:7200

# Check that a slice written by slicecap is a complete capture
./pcapgen verify part_0.pcap

# Concatenation of the slices must give back the source
./pcapgen compare big.pcap rebuilt.pcap
 */
