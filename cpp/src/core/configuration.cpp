#include "udmis/core/configuration.hpp"
#include "udmis/core/errors.hpp"
#include <stdexcept>

namespace udmis {

Configuration::Configuration(const std::vector<bool>& occupied) : occ_(occupied.size(), 0) {
    for (size_t i = 0; i < occupied.size(); ++i) {
        occ_[i] = occupied[i] ? 1 : 0;
    }
}

Configuration Configuration::init_random(size_t n, RNG& rng) {
    Configuration config(n);
    for (size_t i = 0; i < n; ++i) {
        config.occ_[i] = rng.bernoulli(0.5) ? 1 : 0;
    }
    return config;
}

Configuration Configuration::from_bitstring(std::string_view bits, BitOrder order) {
    const size_t n = bits.size();
    Configuration config(n);
    for (size_t k = 0; k < n; ++k) {
        char c = bits[k];
        if (c != '0' && c != '1') {
            throw InvalidInputError(
                "Configuration: invalid character '" + std::string(1, c) +
                "' at position " + std::to_string(k) + " of bitstring"
            );
        }
        size_t vertex = (order == BitOrder::Reversed) ? n - 1 - k : k;
        config.occ_[vertex] = (c == '1') ? 1 : 0;
    }
    return config;
}

std::string Configuration::to_bitstring(BitOrder order) const {
    const size_t n = occ_.size();
    std::string bits(n, '0');
    for (size_t vertex = 0; vertex < n; ++vertex) {
        size_t k = (order == BitOrder::Reversed) ? n - 1 - vertex : vertex;
        if (occ_[vertex]) bits[k] = '1';
    }
    return bits;
}

void Configuration::check_index(Index i) const {
    if (i < 0 || static_cast<size_t>(i) >= occ_.size()) {
        throw std::out_of_range(
            "vertex index " + std::to_string(i) + " out of range [0, " + std::to_string(occ_.size()) + ")"
        );
    }
}

bool Configuration::occupied(Index i) const {
    check_index(i);
    return occ_[static_cast<size_t>(i)] != 0;
}

void Configuration::set(Index i, bool occupied) {
    check_index(i);
    occ_[static_cast<size_t>(i)] = occupied ? 1 : 0;
}

void Configuration::flip(Index i) {
    check_index(i);
    occ_[static_cast<size_t>(i)] ^= 1;
}

int Configuration::count_occupied() const {
    int count = 0;
    for (uint8_t o : occ_) count += o;
    return count;
}

std::vector<Index> Configuration::occupied_vertices() const {
    std::vector<Index> result;
    for (size_t i = 0; i < occ_.size(); ++i) {
        if (occ_[i]) result.push_back(static_cast<Index>(i));
    }
    return result;
}

std::vector<bool> Configuration::to_vector() const {
    std::vector<bool> result(occ_.size());
    for (size_t i = 0; i < occ_.size(); ++i) {
        result[i] = occ_[i] != 0;
    }
    return result;
}

void check_sizes(const UnitDiskGraph& graph, const Configuration& config) {
    if (graph.size() != config.size()) {
        throw InvalidInputError(
            "configuration has " + std::to_string(config.size()) +
            " vertices, graph has " + std::to_string(graph.size())
        );
    }
}

int count_violations(const UnitDiskGraph& graph, const Configuration& config) {
    check_sizes(graph, config);
    int count = 0;
    for (const auto& [i, j] : graph.edges()) {
        if (config[i] && config[j]) ++count;
    }
    return count;
}

bool is_independent_set(const UnitDiskGraph& graph, const Configuration& config) {
    return count_violations(graph, config) == 0;
}

int repair_independent_set(const UnitDiskGraph& graph, Configuration& config) {
    check_sizes(graph, config);
    const Index n = static_cast<Index>(graph.size());

    std::vector<int> conflicts(graph.size(), 0);
    for (Index i = 0; i < n; ++i) {
        if (!config[i]) continue;
        for (Index j : graph.neighbors(i)) {
            if (config[j]) ++conflicts[static_cast<size_t>(i)];
        }
    }

    int removed = 0;
    while (true) {
        Index worst = -1;
        for (Index i = 0; i < n; ++i) {
            if (config[i] && conflicts[static_cast<size_t>(i)] > 0 &&
                (worst < 0 || conflicts[static_cast<size_t>(i)] > conflicts[static_cast<size_t>(worst)])) {
                worst = i;
            }
        }
        if (worst < 0) break;

        config.set(worst, false);
        conflicts[static_cast<size_t>(worst)] = 0;
        for (Index j : graph.neighbors(worst)) {
            if (config[j]) --conflicts[static_cast<size_t>(j)];
        }
        ++removed;
    }
    return removed;
}

}  // namespace udmis
