/**
 * @file ArrayIO.cpp
 * @brief Array file readers (.npy, OpenCV FileStorage, rasters) and .npy writer
 */

#include "phasecloud/io/ArrayIO.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace phasecloud {
namespace io {

namespace {

const char* const kComponent = "ArrayIO";
const char kNpyMagic[] = "\x93NUMPY";
const size_t kNpyMagicLength = 6;

struct NpyHeader {
    char byteOrder = '<';
    char kind = 'f';
    size_t itemSize = 8;
    bool fortranOrder = false;
    std::vector<size_t> shape;
};

bool hostIsLittleEndian() {
    const uint16_t probe = 1;
    unsigned char first = 0;
    std::memcpy(&first, &probe, 1);
    return first == 1;
}

template<typename T>
double readElement(const char* src, bool swap) {
    char buffer[sizeof(T)];
    std::memcpy(buffer, src, sizeof(T));
    if (swap) {
        std::reverse(buffer, buffer + sizeof(T));
    }
    T value;
    std::memcpy(&value, buffer, sizeof(T));
    return static_cast<double>(value);
}

using ElementReader = double (*)(const char*, bool);

ElementReader selectReader(char kind, size_t itemSize) {
    switch (kind) {
        case 'f':
            if (itemSize == 4) return &readElement<float>;
            if (itemSize == 8) return &readElement<double>;
            break;
        case 'i':
            if (itemSize == 1) return &readElement<int8_t>;
            if (itemSize == 2) return &readElement<int16_t>;
            if (itemSize == 4) return &readElement<int32_t>;
            if (itemSize == 8) return &readElement<int64_t>;
            break;
        case 'u':
            if (itemSize == 1) return &readElement<uint8_t>;
            if (itemSize == 2) return &readElement<uint16_t>;
            if (itemSize == 4) return &readElement<uint32_t>;
            if (itemSize == 8) return &readElement<uint64_t>;
            break;
        case 'b':
            if (itemSize == 1) return &readElement<uint8_t>;
            break;
        default:
            break;
    }
    return nullptr;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[noreturn]] void throwMalformed(const std::string& source, const std::string& what) {
    PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                          "Malformed .npy file " + source + ": " + what);
}

// Position just past "'key':" in the header dictionary
size_t findKeyValue(const std::string& header, const std::string& key, const std::string& source) {
    size_t pos = header.find("'" + key + "'");
    if (pos == std::string::npos) {
        pos = header.find("\"" + key + "\"");
    }
    if (pos == std::string::npos) {
        throwMalformed(source, "header has no '" + key + "' entry");
    }
    size_t colon = header.find(':', pos + key.size() + 2);
    if (colon == std::string::npos) {
        throwMalformed(source, "header entry '" + key + "' has no value");
    }
    size_t value = colon + 1;
    while (value < header.size() && std::isspace(static_cast<unsigned char>(header[value]))) {
        ++value;
    }
    return value;
}

NpyHeader parseHeader(const std::string& header, const std::string& source) {
    NpyHeader result;

    // descr: '<f8'
    size_t pos = findKeyValue(header, "descr", source);
    if (pos >= header.size() || (header[pos] != '\'' && header[pos] != '"')) {
        throwMalformed(source, "descr is not a string");
    }
    const char quote = header[pos];
    size_t close = header.find(quote, pos + 1);
    if (close == std::string::npos) {
        throwMalformed(source, "unterminated descr");
    }
    const std::string descr = header.substr(pos + 1, close - pos - 1);
    if (descr.size() < 3) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              "Unsupported dtype '" + descr + "' in " + source);
    }
    result.byteOrder = descr[0];
    result.kind = descr[1];
    size_t itemSize = 0;
    for (size_t i = 2; i < descr.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(descr[i]))) {
            PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                                  "Unsupported dtype '" + descr + "' in " + source);
        }
        itemSize = itemSize * 10 + static_cast<size_t>(descr[i] - '0');
    }
    result.itemSize = itemSize;

    // fortran_order: True | False
    pos = findKeyValue(header, "fortran_order", source);
    if (header.compare(pos, 4, "True") == 0) {
        result.fortranOrder = true;
    } else if (header.compare(pos, 5, "False") == 0) {
        result.fortranOrder = false;
    } else {
        throwMalformed(source, "fortran_order is not a boolean");
    }

    // shape: (rows, cols)
    pos = findKeyValue(header, "shape", source);
    if (pos >= header.size() || header[pos] != '(') {
        throwMalformed(source, "shape is not a tuple");
    }
    close = header.find(')', pos);
    if (close == std::string::npos) {
        throwMalformed(source, "unterminated shape tuple");
    }
    std::stringstream tuple(header.substr(pos + 1, close - pos - 1));
    std::string item;
    while (std::getline(tuple, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(),
                                  [](unsigned char c) { return std::isspace(c) || c == 'L'; }),
                   item.end());
        if (item.empty()) {
            continue;
        }
        size_t dim = 0;
        for (char c : item) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throwMalformed(source, "shape entry '" + item + "' is not an integer");
            }
            dim = dim * 10 + static_cast<size_t>(c - '0');
        }
        result.shape.push_back(dim);
    }

    return result;
}

std::vector<char> readFileBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                              "Cannot open " + path);
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    if (file.bad()) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                              "Read error on " + path);
    }
    return bytes;
}

cv::Mat toSingleChannelDouble(const cv::Mat& input, const std::string& source) {
    if (input.channels() != 1) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              source + " has " + std::to_string(input.channels()) +
                              " channels, expected a single-channel array");
    }
    if (input.dims != 2) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              source + " is not a 2-D array");
    }
    cv::Mat output;
    input.convertTo(output, CV_64F);
    return output;
}

} // namespace

cv::Mat ArrayIO::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                              "Input file not found: " + path);
    }

    const std::string ext = toLower(std::filesystem::path(path).extension().string());
    cv::Mat array;
    if (ext == ".npy") {
        array = loadNpy(path);
    } else if (ext == ".yml" || ext == ".yaml" || ext == ".xml" || ext == ".json") {
        array = loadFileStorage(path);
    } else if (ext == ".tif" || ext == ".tiff" || ext == ".exr" || ext == ".png" || ext == ".pfm") {
        array = loadImage(path);
    } else {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              "Unsupported array file extension '" + ext + "': " + path);
    }

    PHASECLOUD_LOG_DEBUG(kComponent) << "Loaded " << path << " (" << array.rows
                                     << "x" << array.cols << ")";
    return array;
}

cv::Mat ArrayIO::loadNpy(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                              "Input file not found: " + path);
    }
    return decodeNpy(readFileBytes(path), path);
}

cv::Mat ArrayIO::decodeNpy(const std::vector<char>& bytes, const std::string& source) {
    if (bytes.size() < 10 || std::memcmp(bytes.data(), kNpyMagic, kNpyMagicLength) != 0) {
        throwMalformed(source, "missing NUMPY magic string");
    }

    const auto major = static_cast<unsigned char>(bytes[6]);
    size_t headerLength = 0;
    size_t headerOffset = 0;
    if (major == 1) {
        headerLength = static_cast<unsigned char>(bytes[8]) |
                       (static_cast<size_t>(static_cast<unsigned char>(bytes[9])) << 8);
        headerOffset = 10;
    } else if (major == 2 || major == 3) {
        if (bytes.size() < 12) {
            throwMalformed(source, "truncated header length");
        }
        headerLength = 0;
        for (int i = 3; i >= 0; --i) {
            headerLength = (headerLength << 8) | static_cast<unsigned char>(bytes[8 + i]);
        }
        headerOffset = 12;
    } else {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              "Unsupported .npy format version " + std::to_string(major) +
                              " in " + source);
    }

    if (headerOffset + headerLength > bytes.size()) {
        throwMalformed(source, "truncated header");
    }

    const std::string headerText(bytes.data() + headerOffset, headerLength);
    const NpyHeader header = parseHeader(headerText, source);

    if (header.shape.size() != 2) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              source + " holds a " + std::to_string(header.shape.size()) +
                              "-D array, expected 2-D");
    }

    ElementReader reader = selectReader(header.kind, header.itemSize);
    if (reader == nullptr) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              std::string("Unsupported dtype '") + header.byteOrder + header.kind +
                              std::to_string(header.itemSize) + "' in " + source);
    }

    const size_t rows = header.shape[0];
    const size_t cols = header.shape[1];
    if (rows > static_cast<size_t>(INT_MAX) || cols > static_cast<size_t>(INT_MAX)) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              source + " is too large");
    }

    const size_t dataOffset = headerOffset + headerLength;
    const size_t dataBytes = rows * cols * header.itemSize;
    if (bytes.size() - dataOffset < dataBytes) {
        throwMalformed(source, "expected " + std::to_string(dataBytes) + " data bytes, found " +
                       std::to_string(bytes.size() - dataOffset));
    }

    bool swap = false;
    if (header.itemSize > 1) {
        if (header.byteOrder == '<') {
            swap = !hostIsLittleEndian();
        } else if (header.byteOrder == '>') {
            swap = hostIsLittleEndian();
        }
    }

    cv::Mat array(static_cast<int>(rows), static_cast<int>(cols), CV_64F);
    const char* data = bytes.data() + dataOffset;
    for (size_t i = 0; i < rows; ++i) {
        double* row = array.ptr<double>(static_cast<int>(i));
        for (size_t j = 0; j < cols; ++j) {
            const size_t index = header.fortranOrder ? (j * rows + i) : (i * cols + j);
            row[j] = reader(data + index * header.itemSize, swap);
        }
    }

    return array;
}

cv::Mat ArrayIO::loadFileStorage(const std::string& path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                              "Cannot parse " + path + ": " + e.what());
    }
    if (!fs.isOpened()) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                              "Cannot open " + path);
    }

    cv::FileNode node = fs["data"];
    if (node.empty()) {
        // Fall back to the first top-level opencv-matrix node
        cv::FileNode root = fs.root();
        for (auto it = root.begin(); it != root.end(); ++it) {
            cv::FileNode candidate = *it;
            if (candidate.isMap() && !candidate["rows"].empty() && !candidate["data"].empty()) {
                node = candidate;
                break;
            }
        }
    }
    if (node.empty()) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              "No matrix node found in " + path);
    }

    cv::Mat array;
    try {
        node >> array;
    } catch (const cv::Exception& e) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                              "Cannot read matrix from " + path + ": " + e.what());
    }
    if (array.empty()) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                              "Empty matrix in " + path);
    }
    return toSingleChannelDouble(array, path);
}

cv::Mat ArrayIO::loadImage(const std::string& path) {
    cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_FILE_IO,
                              "Cannot decode image " + path);
    }
    return toSingleChannelDouble(image, path);
}

void ArrayIO::saveNpy(const std::string& path, const cv::Mat& array) {
    if (array.channels() != 1 || array.dims != 2) {
        PHASECLOUD_THROW_CODE(core::Exception, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              "Only single-channel 2-D arrays can be saved as .npy");
    }

    cv::Mat data;
    array.convertTo(data, CV_64F);

    std::ostringstream dict;
    dict << "{'descr': '<f8', 'fortran_order': False, 'shape': ("
         << data.rows << ", " << data.cols << "), }";
    std::string header = dict.str();
    // Magic + version + length + header + newline is padded to a multiple of 64
    const size_t unpadded = 10 + header.size() + 1;
    header.append((64 - unpadded % 64) % 64, ' ');
    header.push_back('\n');

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        PHASECLOUD_THROW_CODE(core::Exception, core::ResultCode::ERROR_FILE_IO,
                              "Cannot open " + path + " for writing");
    }

    file.write(kNpyMagic, kNpyMagicLength);
    const char version[2] = {1, 0};
    file.write(version, 2);
    const char length[2] = {static_cast<char>(header.size() & 0xff),
                            static_cast<char>((header.size() >> 8) & 0xff)};
    file.write(length, 2);
    file.write(header.data(), static_cast<std::streamsize>(header.size()));

    const bool swap = !hostIsLittleEndian();
    for (int i = 0; i < data.rows; ++i) {
        const double* row = data.ptr<double>(i);
        for (int j = 0; j < data.cols; ++j) {
            char buffer[sizeof(double)];
            std::memcpy(buffer, &row[j], sizeof(double));
            if (swap) {
                std::reverse(buffer, buffer + sizeof(double));
            }
            file.write(buffer, sizeof(double));
        }
    }

    file.flush();
    if (!file.good()) {
        PHASECLOUD_THROW_CODE(core::Exception, core::ResultCode::ERROR_FILE_IO,
                              "Write error on " + path);
    }
}

} // namespace io
} // namespace phasecloud
