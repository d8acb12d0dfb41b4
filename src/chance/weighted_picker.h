#pragma once

#include <cmath>
#include <cstddef>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include "core/log.h"

// Chance WeightedPicker subsystem
// Responsible for: sampling items by relative weight (loot tables, spawn tables) in O(1) per pick.
// Should NOT do: change weights after construction, add or remove items, or own a random source.
namespace sprocket::chance {

// Vose's alias method: O(n) construction, O(1) selection.
// https://www.keithschwarz.com/darts-dice-coins/
template <typename T>
class WeightedPicker {
public:
    using Entry = std::pair<T, double>;

    // Empty when entries is empty, any weight is negative or non-finite, or the total is zero.
    static std::optional<WeightedPicker> create(std::vector<Entry> entries);

    // Builds a picker, picks once, and moves the chosen item out.
    template <typename Rng>
    static std::optional<T> pickOnce(std::vector<Entry> entries, Rng& rng);

    template <typename Rng>
    std::size_t pickIndex(Rng& rng) const;

    template <typename Rng>
    const T& pick(Rng& rng) const;

    // Null when index is out of range. Items may be edited; their weights may not.
    const T* itemAt(std::size_t index) const;
    T* itemAt(std::size_t index);

    std::size_t size() const;
    // Normalized weight of the item at index, in [0, 1].
    double probabilityOf(std::size_t index) const;

private:
    WeightedPicker() = default;

    std::vector<T> m_items;
    std::vector<double> m_normalized;
    std::vector<double> m_prob;
    std::vector<std::size_t> m_alias;
};

template <typename T>
inline std::optional<WeightedPicker<T>> WeightedPicker<T>::create(std::vector<Entry> entries) {
    if (entries.empty()) {
        SPROCKET_LOGW("chance") << "WeightedPicker needs at least one entry";
        return std::nullopt;
    }

    double totalWeight = 0.0;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const double weight = entries[i].second;
        if (!std::isfinite(weight) || weight < 0.0) {
            SPROCKET_LOGW("chance") << "WeightedPicker entry " << i << " has invalid weight " << weight;
            return std::nullopt;
        }
        totalWeight += weight;
    }
    if (!(totalWeight > 0.0) || !std::isfinite(totalWeight)) {
        SPROCKET_LOGW("chance") << "WeightedPicker total weight must be positive, got " << totalWeight;
        return std::nullopt;
    }

    const std::size_t count = entries.size();
    WeightedPicker picker;
    picker.m_items.reserve(count);
    picker.m_normalized.reserve(count);
    picker.m_prob.assign(count, 0.0);
    picker.m_alias.assign(count, 0);

    // Scale so the average column holds exactly 1.
    std::vector<double> scaled(count, 0.0);
    std::vector<std::size_t> small;
    std::vector<std::size_t> large;
    for (std::size_t i = 0; i < count; ++i) {
        picker.m_normalized.push_back(entries[i].second / totalWeight);
        scaled[i] = picker.m_normalized[i] * static_cast<double>(count);
        if (scaled[i] < 1.0) {
            small.push_back(i);
        } else {
            large.push_back(i);
        }
        picker.m_items.push_back(std::move(entries[i].first));
    }

    while (!small.empty() && !large.empty()) {
        const std::size_t less = small.back();
        small.pop_back();
        const std::size_t more = large.back();
        large.pop_back();

        picker.m_prob[less] = scaled[less];
        picker.m_alias[less] = more;

        scaled[more] = (scaled[more] + scaled[less]) - 1.0;
        if (scaled[more] < 1.0) {
            small.push_back(more);
        } else {
            large.push_back(more);
        }
    }
    // Leftovers are full columns; anything still in `small` is rounding error.
    for (const std::size_t index : large) {
        picker.m_prob[index] = 1.0;
        picker.m_alias[index] = index;
    }
    for (const std::size_t index : small) {
        picker.m_prob[index] = 1.0;
        picker.m_alias[index] = index;
    }

    SPROCKET_LOGD("chance") << "WeightedPicker built with " << count << " entries, total weight " << totalWeight;
    return picker;
}

template <typename T>
template <typename Rng>
inline std::optional<T> WeightedPicker<T>::pickOnce(std::vector<Entry> entries, Rng& rng) {
    std::optional<WeightedPicker> picker = create(std::move(entries));
    if (!picker.has_value()) {
        return std::nullopt;
    }
    const std::size_t index = picker->pickIndex(rng);
    return std::optional<T>(std::move(picker->m_items[index]));
}

template <typename T>
template <typename Rng>
inline std::size_t WeightedPicker<T>::pickIndex(Rng& rng) const {
    std::uniform_int_distribution<std::size_t> columnDist(0, m_prob.size() - 1);
    std::uniform_real_distribution<double> coinDist(0.0, 1.0);
    const std::size_t column = columnDist(rng);
    const bool keepColumn = coinDist(rng) < m_prob[column];
    return keepColumn ? column : m_alias[column];
}

template <typename T>
template <typename Rng>
inline const T& WeightedPicker<T>::pick(Rng& rng) const {
    return m_items[pickIndex(rng)];
}

template <typename T>
inline const T* WeightedPicker<T>::itemAt(std::size_t index) const {
    if (index >= m_items.size()) {
        return nullptr;
    }
    return &m_items[index];
}

template <typename T>
inline T* WeightedPicker<T>::itemAt(std::size_t index) {
    if (index >= m_items.size()) {
        return nullptr;
    }
    return &m_items[index];
}

template <typename T>
inline std::size_t WeightedPicker<T>::size() const {
    return m_items.size();
}

template <typename T>
inline double WeightedPicker<T>::probabilityOf(std::size_t index) const {
    if (index >= m_normalized.size()) {
        return 0.0;
    }
    return m_normalized[index];
}

} // namespace sprocket::chance
