#include "Params.hpp"
#include "Replications.hpp"
#include "Reporting.hpp"
#include "Utils.hpp"
#include <cassert>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

static std::vector<std::string> readCompressedLines(const std::string& path) {
    gzFile source = gzopen(path.c_str(), "rb");
    if (source == nullptr) {
        throw std::runtime_error("Could not open compressed file " + path);
    }

    std::vector<std::string> lines;
    std::string current;
    char buffer[4096];
    int bytesRead = 0;
    while ((bytesRead = gzread(source, buffer, sizeof(buffer))) > 0) {
        for (int i = 0; i < bytesRead; ++i) {
            if (buffer[i] == '\n') {
                lines.push_back(current);
                current.clear();
            } else {
                current += buffer[i];
            }
        }
    }
    gzclose(source);
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

static SimulationConfig smallConfig() {
    SimulationConfig config = makeBaseConfig("small");
    config.rounds = 3;
    config.replications = 6;
    config.roster = {
        reputationTrackers(2, config.payoffs, true),
        pureEvil(1)
    };
    return config;
}

static void testCsvRecorder() {
    CsvRecorder recorder("small", 4);
    RoundStats stats{2, 3, {{"pure evil", 1, 259.0}, {"reputation tracker", 2, 254.5}}};
    recorder.reportRound(stats);
    assert(recorder.lines().size() == 2);
    assert(recorder.lines()[0] == "small,4,2,pure evil,1,259.000000");
    assert(recorder.lines()[1] == "small,4,2,reputation tracker,2,254.500000");
    assert(CsvRecorder::header() == "configuration,replication,round,strategy,count,mean_energy");
}

static void testReplicationsComeBackInOrder() {
    SimulationConfig config = smallConfig();
    std::vector<ReplicationResult> results = runReplications(config);
    assert(results.size() == config.replications);

    for (size_t rep = 0; rep < results.size(); ++rep) {
        const ReplicationResult& result = results[rep];
        assert(result.history.size() == config.rounds);
        assert(result.survivors.round == config.rounds);
        // two labels per round plus the final state
        assert(result.csvLines.size() == 2 * (config.rounds + 1));
        std::string prefix = "small," + std::to_string(rep) + ",";
        for (const auto& line : result.csvLines) {
            assert(line.rfind(prefix, 0) == 0);
        }
    }

    // nothing random in this roster, so every replication agrees
    for (const auto& result : results) {
        assert(result.history == results[0].history);
        assert(result.survivors == results[0].survivors);
    }
}

static void testReplicationsRepeat() {
    SimulationConfig config = makeConfigurations()[2];
    config.rounds = 10;
    config.replications = 4;
    std::vector<ReplicationResult> first = runReplications(config);
    std::vector<ReplicationResult> second = runReplications(config);
    for (size_t rep = 0; rep < first.size(); ++rep) {
        assert(first[rep].history == second[rep].history);
        assert(first[rep].csvLines == second[rep].csvLines);
    }
}

static void testReplicationErrorsPropagate() {
    SimulationConfig config = smallConfig();
    config.roster.push_back(randomAgents(1, -1.0, 0.5, "invalid"));
    bool threw = false;
    try {
        runReplications(config);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

static void testCompressedCsv() {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "borrow_lend_test_output";
    std::filesystem::remove_all(dir);

    std::vector<std::string> csvData{CsvRecorder::header(), "small,0,0,pure evil,1,256.000000"};
    std::string written = writeAndCompressCSV(dir.string(), "borrow_lend_small", csvData);
    assert(written == (dir / "borrow_lend_small.csv.gz").string());
    assert(std::filesystem::exists(written));
    assert(!std::filesystem::exists(dir / "borrow_lend_small.csv"));
    assert(readCompressedLines(written) == csvData);

    std::filesystem::remove_all(dir);
}

int main() {
    testCsvRecorder();
    testReplicationsComeBackInOrder();
    testReplicationsRepeat();
    testReplicationErrorsPropagate();
    testCompressedCsv();
    return 0;
}
