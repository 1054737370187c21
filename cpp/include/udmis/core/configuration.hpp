#pragma once

#include "types.hpp"
#include "graph.hpp"
#include "../random/rng.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace udmis {

// Index convention of an external bitstring.
// Hardware and circuit simulators report qubit n-1 first, so their samples
// are read with Reversed to line up with the vertex numbering.
enum class BitOrder {
    VertexOrder,  // character k <-> vertex k
    Reversed      // character k <-> vertex n-1-k
};

// Occupation state of every vertex (1 = occupied)
class Configuration {
public:
    Configuration() = default;
    explicit Configuration(size_t n, bool occupied = false) : occ_(n, occupied ? 1 : 0) {}
    explicit Configuration(const std::vector<bool>& occupied);

    // Independent Bernoulli(0.5) occupation per vertex
    static Configuration init_random(size_t n, RNG& rng);

    // Parse a '0'/'1' string; throws InvalidInputError on other characters
    static Configuration from_bitstring(std::string_view bits, BitOrder order = BitOrder::VertexOrder);

    [[nodiscard]] std::string to_bitstring(BitOrder order = BitOrder::VertexOrder) const;

    [[nodiscard]] size_t size() const { return occ_.size(); }

    // Unchecked access
    [[nodiscard]] bool operator[](Index i) const { return occ_[static_cast<size_t>(i)] != 0; }

    // Checked access (std::out_of_range)
    [[nodiscard]] bool occupied(Index i) const;
    void set(Index i, bool occupied);
    void flip(Index i);

    [[nodiscard]] int count_occupied() const;
    [[nodiscard]] std::vector<Index> occupied_vertices() const;

    [[nodiscard]] std::vector<bool> to_vector() const;

    [[nodiscard]] bool operator==(const Configuration& other) const { return occ_ == other.occ_; }

private:
    std::vector<uint8_t> occ_;

    void check_index(Index i) const;
};

// Throws InvalidInputError unless config has one entry per graph vertex
void check_sizes(const UnitDiskGraph& graph, const Configuration& config);

// Number of edges with both endpoints occupied
[[nodiscard]] int count_violations(const UnitDiskGraph& graph, const Configuration& config);

// True when no two occupied vertices are adjacent
[[nodiscard]] bool is_independent_set(const UnitDiskGraph& graph, const Configuration& config);

// Greedily unoccupy the vertex with the most occupied neighbors until the
// configuration is an independent set. Ties go to the lowest index.
// Returns the number of vertices removed.
int repair_independent_set(const UnitDiskGraph& graph, Configuration& config);

}  // namespace udmis
