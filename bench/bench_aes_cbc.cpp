#include <chrono>
#include <cstring>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "cipher/AES/aes.hpp"
#include "mode/CBC.hpp"
#include "adapters/openssl_adapter.hpp"
#include "adapters/crypto_pp_adapter.hpp"

using Clock = std::chrono::high_resolution_clock;

struct BenchResult {
    std::string impl;
    size_t size;
    double mbps;
    double usec_per_op;
};

static void fillPattern(std::vector<uint8_t>& v, uint8_t seed) {
    for (size_t i = 0; i < v.size(); ++i)
        v[i] = static_cast<uint8_t>(seed + i);
}

static BenchResult bench_run(const std::string& impl, size_t dataSize, size_t iters,
    const std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>& encrypt)
{
    std::vector<uint8_t> pt(dataSize);
    fillPattern(pt, 0x33);

    // Warmup
    auto ct = encrypt(pt);

    auto start = Clock::now();
    for (size_t i = 0; i < iters; ++i) {
        ct = encrypt(pt);
    }
    auto end = Clock::now();

    auto dur = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    double seconds = dur / 1e6;
    double total_bytes = static_cast<double>(dataSize) * iters;
    double mbps = seconds > 0 ? (total_bytes / (1024.0 * 1024.0)) / seconds : 0.0;
    double usec_per_op = static_cast<double>(dur) / iters;

    return { impl, dataSize, mbps, usec_per_op };
}

int main(int argc, char** argv)
{
    std::string outFile = "bench_results.csv";
    size_t iters = 100;

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            outFile = argv[++i];
        } else if (std::strcmp(argv[i], "--iters") == 0 && i + 1 < argc) {
            try {
                iters = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --iters value '" << argv[i] << "'\n";
                return 1;
            }
        }
    }
    if (iters == 0) {
        std::cerr << "Error: --iters must be positive\n";
        return 1;
    }

    std::vector<uint8_t> key(16);
    std::vector<uint8_t> iv(16);
    fillPattern(key, 0x11);
    fillPattern(iv, 0x22);

    std::vector<size_t> sizes = { 1024, 4096, 16384, 65536, 262144 };
    std::vector<BenchResult> results;

    std::cerr << "[*] Starting benchmarks (iters=" << iters << ")...\n";

    try {
        AES aes(key);
        OpenSSL_AES128_Adapter ossl;
        CryptoPP_AES128_Adapter cpp;
        ossl.setKey(key);
        cpp.setKey(key);

        CBC cbc(iv);

        for (auto size : sizes) {
            std::cerr << "[*] CBC/AES-128 size=" << size << "\n";
            results.push_back(bench_run("aes128cbc", size, iters,
                [&](const std::vector<uint8_t>& pt) { return cbc.encrypt(pt, aes); }));

            std::cerr << "[*] CBC/OpenSSL-block size=" << size << "\n";
            results.push_back(bench_run("CBC+" + ossl.sourceName(), size, iters,
                [&](const std::vector<uint8_t>& pt) { return cbc.encrypt(pt, ossl); }));

            std::cerr << "[*] CBC/Crypto++-block size=" << size << "\n";
            results.push_back(bench_run("CBC+" + cpp.sourceName(), size, iters,
                [&](const std::vector<uint8_t>& pt) { return cbc.encrypt(pt, cpp); }));

            std::cerr << "[*] OpenSSL EVP_aes_128_cbc size=" << size << "\n";
            results.push_back(bench_run("OpenSSL-CBC", size, iters,
                [&](const std::vector<uint8_t>& pt) { return OpenSSL_AES128_CBC_Encrypt(pt, key, iv); }));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Write CSV
    std::ofstream ofs(outFile);
    ofs << "impl,size_bytes,throughput_MBps,latency_usec\n";
    for (auto& r : results) {
        ofs << r.impl << ","
            << r.size << ","
            << std::fixed << std::setprecision(2) << r.mbps << ","
            << std::fixed << std::setprecision(2) << r.usec_per_op << "\n";
    }

    // Print summary to console
    std::cerr << "\n[*] Results saved to " << outFile << "\n";
    std::cerr << "\n=== Summary ===\n";
    std::cerr << std::left << std::setw(16) << "Impl"
              << std::setw(12) << "Size"
              << std::setw(14) << "Throughput"
              << "Latency\n";
    std::cerr << std::string(54, '-') << "\n";
    for (auto& r : results) {
        std::cerr << std::left << std::setw(16) << r.impl
                  << std::setw(12) << r.size
                  << std::fixed << std::setprecision(2)
                  << std::setw(10) << r.mbps << " MB/s"
                  << std::setw(10) << r.usec_per_op << " us\n";
    }

    return 0;
}
