/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Utilities for parsing radar track CSV files.
 *
 */

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "GuessConstants.hpp"
#include "ParseError.hpp"
#include "TrackReader.hpp"

namespace trk_guess {

namespace {

std::string trim(const std::string &value)
{
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> splitCsvLine(const std::string &line)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == std::string::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

// strict conversions: the whole field must be consumed and the value finite
bool toDouble(const std::string &text, double &value)
{
    if (text.empty()) {
        return false;
    }
    try {
        size_t pos = 0;
        value = std::stod(text, &pos);
        return pos == text.size() && std::isfinite(value);
    } catch (const std::logic_error &) {
        return false;
    }
}

bool toInt(const std::string &text, int &value)
{
    if (text.empty()) {
        return false;
    }
    try {
        size_t pos = 0;
        value = std::stoi(text, &pos);
        return pos == text.size();
    } catch (const std::logic_error &) {
        return false;
    }
}

} // namespace

double parseTimestamp(const std::string &text)
{
    std::string value = trim(text);

    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }

    if (parts.empty() || parts.size() > 3) {
        throw ParseError{"invalid time \"" + text + "\""};
    }

    // seconds may be fractional; the leading fields must be whole numbers
    double seconds = 0.0;
    if (!toDouble(parts.back(), seconds) || seconds < 0.0) {
        throw ParseError{"invalid time \"" + text + "\""};
    }
    if (parts.size() == 1) {
        return seconds;
    }

    int minutes = 0;
    if (!toInt(parts[parts.size() - 2], minutes) || minutes < 0) {
        throw ParseError{"invalid time \"" + text + "\""};
    }
    int hours = 0;
    if (parts.size() == 3 && (!toInt(parts[0], hours) || hours < 0)) {
        throw ParseError{"invalid time \"" + text + "\""};
    }

    return hours * SECONDS_PER_HOUR + minutes * SECONDS_PER_MINUTE + seconds;
}

std::vector<PositionSample> readTracks(std::istream &stream, const std::string &date)
{
    std::vector<PositionSample> samples;

    int lineno = 0;
    bool sawData = false;
    std::string line;
    while (std::getline(stream, line)) {
        lineno++;
        if (trim(line).empty()) {
            continue;
        }

        auto fields = splitCsvLine(line);
        if (fields.size() != TRACK_FIELD_COUNT) {
            std::stringstream msg;
            msg << "expected " << TRACK_FIELD_COUNT << " fields, got " << fields.size();
            throw ParseError{msg.str(), lineno};
        }

        PositionSample sample;
        if (!toInt(fields[4], sample.altitudeFt)) {
            if (!sawData) {
                // header row
                sawData = true;
                continue;
            }
            throw ParseError{"invalid altitude \"" + fields[4] + "\"", lineno};
        }
        sawData = true;

        sample.key.callsign = fields[1];
        sample.key.date = date;
        sample.time = fields[0];
        sample.category = fields[5];

        if (sample.key.callsign.empty()) {
            throw ParseError{"empty callsign", lineno};
        }
        if (!toDouble(fields[2], sample.latitudeDeg)) {
            throw ParseError{"invalid latitude \"" + fields[2] + "\"", lineno};
        }
        if (!toDouble(fields[3], sample.longitudeDeg)) {
            throw ParseError{"invalid longitude \"" + fields[3] + "\"", lineno};
        }
        try {
            sample.timestamp = parseTimestamp(fields[0]);
        } catch (const ParseError &ex) {
            throw ParseError{ex.what(), lineno};
        }

        samples.push_back(std::move(sample));
    }

    if (stream.bad()) {
        std::stringstream msg;
        msg << "Couldn't read track stream: line " << lineno;
        throw std::runtime_error{msg.str()};
    }

    return samples;
}

std::vector<PositionSample> readTrackFile(const std::filesystem::path &path, DateMode mode)
{
    std::string date;
    if (mode == DateMode::WithDate) {
        date = dateFromTrackFileName(path);
    }

    std::ifstream inStream(path);
    if (!inStream.is_open()) {
        throw std::runtime_error{"Couldn't open track file: " + path.string()};
    }

    try {
        return readTracks(inStream, date);
    } catch (const ParseError &ex) {
        throw ParseError{path.filename().string(), ex};
    }
}

std::string dateFromTrackFileName(const std::filesystem::path &path)
{
    std::string name = path.filename().string();

    size_t start = name.find("trk");
    if (start != std::string::npos) {
        start += 3;
        size_t end = name.find_first_of("_.", start);
        std::string date = name.substr(start, (end == std::string::npos) ? std::string::npos : end - start);
        bool allDigits = date.size() == TRACK_FILE_DATE_LENGTH;
        for (char ch : date) {
            allDigits = allDigits && std::isdigit(static_cast<unsigned char>(ch));
        }
        if (allDigits) {
            return date;
        }
    }

    throw ParseError{"no trkYYYYMMDD date in file name \"" + name + "\""};
}

std::vector<std::filesystem::path> trackPathsForDates(const std::filesystem::path &dir,
                                                      const std::vector<std::string> &dates,
                                                      const std::vector<std::string> &sourceTimes)
{
    std::vector<std::filesystem::path> paths;
    for (const auto &date : dates) {
        for (const auto &sourceTime : sourceTimes) {
            paths.push_back(dir / ("trk" + date + "_" + sourceTime + ".csv"));
        }
    }
    return paths;
}

} // namespace trk_guess
