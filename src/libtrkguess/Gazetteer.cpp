/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Loading and lookup of airport and fix gazetteers.
 *
 */

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Coordinate.hpp"
#include "Gazetteer.hpp"
#include "GuessConstants.hpp"
#include "ParseError.hpp"

namespace trk_guess {

namespace {

std::vector<std::string> splitFields(const std::string &line)
{
    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    return fields;
}

} // namespace

Gazetteer Gazetteer::load(std::istream &stream, LocationKind kind)
{
    Gazetteer gazetteer(kind);

    int lineno = 0;
    std::string line;
    while (std::getline(stream, line)) {
        lineno++;

        auto fields = splitFields(line);
        if (fields.empty() || fields[0][0] == '#') {
            continue;
        }
        if (fields.size() < GAZETTEER_SHORT_ROW_FIELDS) {
            std::stringstream msg;
            msg << "expected at least " << GAZETTEER_SHORT_ROW_FIELDS << " fields, got " << fields.size();
            throw ParseError{msg.str(), lineno};
        }

        // the long layout carries a column between the name and the latitude
        size_t latIdx = (fields.size() >= GAZETTEER_LONG_ROW_FIELDS) ? 2 : 1;

        Location loc;
        loc.name = fields[0];
        loc.kind = kind;
        try {
            loc.latitudeDeg = parseDmsLatitude(fields[latIdx]);
            loc.longitudeDeg = parseDmsLongitude(fields[latIdx + 1]);
        } catch (const ParseError &ex) {
            throw ParseError{ex.what(), lineno};
        }

        if (gazetteer.m_nameIndex.count(loc.name) != 0) {
            throw ParseError{"duplicate location name \"" + loc.name + "\"", lineno};
        }
        gazetteer.add(loc);
    }

    if (stream.bad()) {
        std::stringstream msg;
        msg << "Couldn't read gazetteer stream: line " << lineno;
        throw std::runtime_error{msg.str()};
    }

    return gazetteer;
}

Gazetteer Gazetteer::loadFile(const std::filesystem::path &path, LocationKind kind)
{
    std::ifstream inStream(path);
    if (!inStream.is_open()) {
        throw std::runtime_error{"Couldn't open gazetteer file: " + path.string()};
    }
    return load(inStream, kind);
}

void Gazetteer::add(const Location &location)
{
    if (m_nameIndex.count(location.name) != 0) {
        throw ParseError{"duplicate location name \"" + location.name + "\""};
    }
    m_nameIndex.emplace(location.name, m_locations.size());
    m_locations.push_back(location);
    m_locations.back().kind = m_kind;
}

std::optional<Location> Gazetteer::lookup(const std::string &name) const
{
    auto it = m_nameIndex.find(name);
    if (it == m_nameIndex.end()) {
        return std::nullopt;
    }
    return m_locations[it->second];
}

std::vector<std::string> Gazetteer::allNames() const
{
    std::vector<std::string> names;
    names.reserve(m_locations.size());
    for (const auto &loc : m_locations) {
        names.push_back(loc.name);
    }
    return names;
}

std::vector<Location> Gazetteer::prioritized(const std::optional<std::vector<std::string>> &names) const
{
    if (!names.has_value()) {
        return m_locations;
    }

    std::vector<Location> ordered;
    ordered.reserve(names->size());
    for (const auto &name : names.value()) {
        auto loc = lookup(name);
        if (!loc.has_value()) {
            std::cerr << "Warning: " << toString(m_kind) << " " << name << " not in gazetteer (ignored)\n";
            continue;
        }
        ordered.push_back(loc.value());
    }
    return ordered;
}

void Gazetteer::dump(std::ostream &outStream) const
{
    outStream << "Gazetteer (" << toString(m_kind) << "s): " << m_locations.size() << " entries\n";
    for (const auto &loc : m_locations) {
        outStream << "    " << loc << "\n";
    }
}

} // namespace trk_guess
