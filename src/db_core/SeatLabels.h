#ifndef SEAT_LABELS_H
#define SEAT_LABELS_H

#include <algorithm>
#include <string>
#include <vector>

namespace SeatLabels {
    // "A" + 1 -> "A1"
    std::string labelFor(const std::string& row, int number);

    // A1..A<count>
    std::vector<std::string> rowLabels(int count, const std::string& row = "A");

    // Natural order: digit runs compare by value, so A2 < A10
    bool naturalLess(const std::string& a, const std::string& b);

    template <typename Container, typename LabelOf>
    void sortNatural(Container& items, LabelOf labelOf) {
        std::stable_sort(items.begin(), items.end(), [&](const auto& x, const auto& y) {
            return naturalLess(labelOf(x), labelOf(y));
        });
    }
} // namespace SeatLabels

#endif // SEAT_LABELS_H
