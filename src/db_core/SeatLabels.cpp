#include "SeatLabels.h"
#include <cctype>

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Compare two digit runs by numeric value without overflowing
int compareDigitRuns(const std::string& a, size_t a_begin, size_t a_end,
                     const std::string& b, size_t b_begin, size_t b_end) {
    while (a_begin < a_end - 1 && a[a_begin] == '0') ++a_begin;
    while (b_begin < b_end - 1 && b[b_begin] == '0') ++b_begin;

    const size_t a_len = a_end - a_begin;
    const size_t b_len = b_end - b_begin;
    if (a_len != b_len) return a_len < b_len ? -1 : 1;

    const int cmp = a.compare(a_begin, a_len, b, b_begin, b_len);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

} // namespace

std::string SeatLabels::labelFor(const std::string& row, int number) {
    return row + std::to_string(number);
}

std::vector<std::string> SeatLabels::rowLabels(int count, const std::string& row) {
    std::vector<std::string> labels;
    if (count <= 0) return labels;
    labels.reserve(static_cast<size_t>(count));
    for (int i = 1; i <= count; ++i) {
        labels.push_back(labelFor(row, i));
    }
    return labels;
}

bool SeatLabels::naturalLess(const std::string& a, const std::string& b) {
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (isDigit(a[i]) && isDigit(b[j])) {
            size_t i_end = i, j_end = j;
            while (i_end < a.size() && isDigit(a[i_end])) ++i_end;
            while (j_end < b.size() && isDigit(b[j_end])) ++j_end;

            const int cmp = compareDigitRuns(a, i, i_end, b, j, j_end);
            if (cmp != 0) return cmp < 0;
            i = i_end;
            j = j_end;
            continue;
        }

        const auto ca = static_cast<unsigned char>(std::toupper(static_cast<unsigned char>(a[i])));
        const auto cb = static_cast<unsigned char>(std::toupper(static_cast<unsigned char>(b[j])));
        if (ca != cb) return ca < cb;
        ++i;
        ++j;
    }

    if ((a.size() - i) != (b.size() - j)) {
        return (a.size() - i) < (b.size() - j);
    }
    // equal under natural order (A01 vs A1, a1 vs A1): fall back to plain order
    return a < b;
}
