/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Ordered collection of named locations (airports or fixes).
 *
 */

#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "Location.hpp"

namespace trk_guess {

class Gazetteer
{
  public:
    using const_iterator = std::vector<Location>::const_iterator;

    explicit Gazetteer(LocationKind kind = LocationKind::Airport) : m_kind(kind) {}
    virtual ~Gazetteer() = default;

    Gazetteer(const Gazetteer &) = default;
    Gazetteer &operator=(const Gazetteer &) = default;
    Gazetteer(Gazetteer &&) = default;
    Gazetteer &operator=(Gazetteer &&) = default;

    /**
     * @brief Parse a gazetteer from whitespace-delimited rows.
     *
     * Accepted row layouts:
     *   name lat_dms lon_dms
     *   name dummy lat_dms lon_dms [ignored...]
     *
     * Blank lines and lines starting with '#' are skipped. Row order is kept
     * and is the assignment priority.
     *
     * @throws ParseError naming the line of the first malformed row or
     *         duplicate name. No partial gazetteer is returned.
     */
    [[nodiscard]] static Gazetteer load(std::istream &stream, LocationKind kind);

    /**
     * @brief Open and parse a gazetteer file.
     *
     * @throws std::runtime_error if the file can't be opened
     * @throws ParseError as for load()
     */
    [[nodiscard]] static Gazetteer loadFile(const std::filesystem::path &path, LocationKind kind);

    /// Append a location. Throws ParseError if the name is already present.
    void add(const Location &location);

    [[nodiscard]] std::optional<Location> lookup(const std::string &name) const;

    /// Names in gazetteer order; the default priority list.
    [[nodiscard]] std::vector<std::string> allNames() const;

    /**
     * @brief Locations named by `names`, in that order.
     *
     * Names that are not in the gazetteer are skipped. A nullopt list
     * returns every location in natural order.
     */
    [[nodiscard]] std::vector<Location> prioritized(const std::optional<std::vector<std::string>> &names) const;

    [[nodiscard]] LocationKind kind() const { return m_kind; }
    [[nodiscard]] size_t size() const { return m_locations.size(); }
    [[nodiscard]] bool empty() const { return m_locations.empty(); }
    [[nodiscard]] const std::vector<Location> &locations() const { return m_locations; }

    const_iterator begin() const { return m_locations.begin(); }
    const_iterator end() const { return m_locations.end(); }

    void dump(std::ostream &outStream) const;

  private:
    LocationKind m_kind;
    std::vector<Location> m_locations;
    std::unordered_map<std::string, size_t> m_nameIndex;
};

} // namespace trk_guess
