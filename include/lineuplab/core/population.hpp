#pragma once

/// @file population.hpp
/// @brief Accumulating lineup population with Structure-of-Arrays layout and PMR support
///
/// Lineups and their fitness values live in separate containers so ranking only touches
/// the fitness array. The population only grows while a search runs; sorting and
/// truncation happen once, when the search is finished.

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <numeric>
#include <span>
#include <vector>

#include <lineuplab/core/concepts.hpp>

namespace lineuplab::core {

/// Population of individuals stored as parallel genome / fitness arrays
///
/// @tparam GenomeT The individual type (problems::Lineup for the lineup search)
template <typename GenomeT>
class Population {
  private:
    std::pmr::vector<GenomeT> genomes_;
    std::pmr::vector<Fitness> fitness_;

  public:
    /// Construct population with reserved capacity and optional custom memory resource
    ///
    /// @param capacity Number of individuals to reserve room for
    /// @param resource Custom memory resource for allocation (default: global default)
    explicit Population(std::size_t capacity = 0,
                        std::pmr::memory_resource* resource = std::pmr::get_default_resource())
        : genomes_(std::pmr::polymorphic_allocator<GenomeT>(resource)),
          fitness_(std::pmr::polymorphic_allocator<Fitness>(resource)) {
        genomes_.reserve(capacity);
        fitness_.reserve(capacity);
    }

    /// Minimum capacity of both containers (actual usable pair slots)
    [[nodiscard]] std::size_t capacity() const noexcept {
        const auto gcap = genomes_.capacity();
        const auto fcap = fitness_.capacity();
        return gcap < fcap ? gcap : fcap;
    }

    [[nodiscard]] std::size_t size() const noexcept { return genomes_.size(); }

    [[nodiscard]] bool empty() const noexcept { return genomes_.empty(); }

    /// Reserve capacity for both arrays and keep their capacities in sync
    void reserve(std::size_t new_cap) {
        genomes_.reserve(new_cap);
        fitness_.reserve(new_cap);
    }

    /// Append an individual
    /// @throws std::exception Strong exception safety guarantee
    void push_back(const GenomeT& genome, Fitness fitness) {
        genomes_.push_back(genome);
        try {
            fitness_.push_back(fitness);
        } catch (...) {
            genomes_.pop_back(); // Restore invariant if fitness insertion fails
            throw;
        }
    }

    /// Append an individual (move version)
    /// @throws std::exception Strong exception safety guarantee
    void push_back(GenomeT&& genome, Fitness fitness) {
        genomes_.push_back(std::move(genome));
        try {
            fitness_.push_back(fitness);
        } catch (...) {
            genomes_.pop_back();
            throw;
        }
    }

    [[nodiscard]] GenomeT& genome(std::size_t index) noexcept { return genomes_[index]; }

    [[nodiscard]] const GenomeT& genome(std::size_t index) const noexcept {
        return genomes_[index];
    }

    [[nodiscard]] const Fitness& fitness(std::size_t index) const noexcept {
        return fitness_[index];
    }

    /// Bounds-checked genome access
    /// @throws std::out_of_range if index is out of bounds
    [[nodiscard]] const GenomeT& at_genome(std::size_t index) const { return genomes_.at(index); }

    [[nodiscard]] std::span<const GenomeT> genomes() const {
        return {genomes_.data(), genomes_.size()};
    }

    [[nodiscard]] std::span<const Fitness> fitness_values() const {
        return {fitness_.data(), fitness_.size()};
    }

    /// Index of the fittest individual; precondition: !empty()
    [[nodiscard]] std::size_t best_index() const noexcept {
        return static_cast<std::size_t>(std::max_element(fitness_.begin(), fitness_.end()) -
                                        fitness_.begin());
    }

    /// Reorder by descending fitness, keeping insertion order among equal scores
    void sort_descending() {
        std::vector<std::size_t> order(size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [this](std::size_t a, std::size_t b) { return fitness_[a] > fitness_[b]; });

        std::pmr::vector<GenomeT> sorted_genomes(genomes_.get_allocator());
        std::pmr::vector<Fitness> sorted_fitness(fitness_.get_allocator());
        sorted_genomes.reserve(genomes_.capacity());
        sorted_fitness.reserve(fitness_.capacity());
        for (const auto idx : order) {
            sorted_genomes.push_back(std::move(genomes_[idx]));
            sorted_fitness.push_back(fitness_[idx]);
        }
        genomes_.swap(sorted_genomes);
        fitness_.swap(sorted_fitness);
    }

    /// Keep only the first `count` individuals; no-op when already smaller
    void truncate(std::size_t count) {
        if (count >= size())
            return;
        genomes_.erase(genomes_.begin() + static_cast<std::ptrdiff_t>(count), genomes_.end());
        fitness_.erase(fitness_.begin() + static_cast<std::ptrdiff_t>(count), fitness_.end());
    }

    [[nodiscard]] std::pmr::memory_resource* get_memory_resource() const noexcept {
        return genomes_.get_allocator().resource();
    }
};

} // namespace lineuplab::core
