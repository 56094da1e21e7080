#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <zlib.h>

// Writes the lines to <outputDir>/<stem>.csv, gzips it and removes the plain
// file. Returns the path of the compressed file, or an empty string on failure.
inline std::string writeAndCompressCSV(const std::string& outputDir, const std::string& stem, const std::vector<std::string>& csvData) {
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "Failed to create output directory " << outputDir << ": " << ec.message() << '\n';
        return {};
    }

    std::string outputCsvPath = outputDir + "/" + stem + ".csv";

    std::ofstream csvFile(outputCsvPath);
    if (!csvFile.is_open()) {
        std::cerr << "Failed to open file for writing: " << outputCsvPath << '\n';
        return {};
    }
    for (const auto& line : csvData) {
        csvFile << line << "\n";
    }
    csvFile.close();

    std::string compressedFilePath = outputCsvPath + ".gz";
    FILE* source = fopen(outputCsvPath.c_str(), "rb");
    gzFile dest = gzopen(compressedFilePath.c_str(), "wb");
    if ((source == nullptr) || (dest == nullptr)) {
        std::cerr << "Failed to open files for compression\n";
        if (source != nullptr) fclose(source);
        if (dest != nullptr) gzclose(dest);
        return {};
    }

    char buffer[8192];
    size_t bytesRead = 0;
    bool ok = true;
    while ((bytesRead = fread(buffer, 1, sizeof(buffer), source)) > 0) {
        if (gzwrite(dest, buffer, static_cast<unsigned>(bytesRead)) == 0) {
            std::cerr << "Failed to compress " << outputCsvPath << '\n';
            ok = false;
            break;
        }
    }

    fclose(source);
    if (gzclose(dest) != Z_OK) {
        ok = false;
    }

    if (std::remove(outputCsvPath.c_str()) != 0) {
        std::cerr << "Failed to remove original file: " << outputCsvPath << '\n';
    }

    return ok ? compressedFilePath : std::string{};
}

#endif // UTILS_HPP
