#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "miniretrieval/Types.hpp"

namespace miniretrieval::algo {

template <typename T>
struct EditCosts {
    std::function<double(const T&)> insertion;           // cost of adding a destination element
    std::function<double(const T&)> deletion;            // cost of dropping a source element
    std::function<double(const T&, const T&)> substitution; // (source, dest)

    static EditCosts unit() {
        return EditCosts{
            [](const T&) { return 1.0; },
            [](const T&) { return 1.0; },
            [](const T& a, const T& b) { return a == b ? 0.0 : 1.0; }
        };
    }
};

// (a, b) substitution or match, (a, nullopt) deletion, (nullopt, b) insertion.
template <typename T>
struct EditOperation {
    std::optional<T> source;
    std::optional<T> dest;

    bool isSubstitution() const { return source && dest; }
    bool isDeletion() const { return source && !dest; }
    bool isInsertion() const { return !source && dest; }
};

template <typename T>
bool operator==(const EditOperation<T>& a, const EditOperation<T>& b) {
    return a.source == b.source && a.dest == b.dest;
}

template <typename T>
using Alignment = std::vector<EditOperation<T>>;

// Full (dest.size() + 1) x (source.size() + 1) cost matrix. Rows index the
// destination, columns the source; row 0 holds cumulative deletion costs and
// column 0 cumulative insertion costs.
template <typename T>
class EditDistanceTable {
public:
    EditDistanceTable(std::vector<T> source, std::vector<T> dest, EditCosts<T> costs = EditCosts<T>::unit())
        : source_(std::move(source)), dest_(std::move(dest)), costs_(std::move(costs)),
          rows_(dest_.size() + 1), cols_(source_.size() + 1), cells_(rows_ * cols_, 0.0) {
        fill();
    }

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }

    double at(std::size_t row, std::size_t col) const {
        if (row >= rows_ || col >= cols_) throw std::out_of_range("EditDistanceTable: cell out of range");
        return cell(row, col);
    }

    double distance() const { return cell(rows_ - 1, cols_ - 1); }

    // Backtrace from the final corner. At each cell the predecessor whose value
    // plus step cost reproduces the cell is taken, trying substitution first,
    // then deletion, then insertion.
    Alignment<T> alignment() const {
        Alignment<T> ops;
        std::size_t i = rows_ - 1;
        std::size_t j = cols_ - 1;
        while (i > 0 || j > 0) {
            const double here = cell(i, j);
            if (i > 0 && j > 0 && cell(i - 1, j - 1) + substitutionCost(i, j) == here) {
                ops.push_back({source_[j - 1], dest_[i - 1]});
                --i;
                --j;
            } else if (j > 0 && cell(i, j - 1) + deletionCost(j) == here) {
                ops.push_back({source_[j - 1], std::nullopt});
                --j;
            } else if (i > 0 && cell(i - 1, j) + insertionCost(i) == here) {
                ops.push_back({std::nullopt, dest_[i - 1]});
                --i;
            } else {
                throw std::logic_error("EditDistanceTable: inconsistent table during backtrace");
            }
        }
        std::reverse(ops.begin(), ops.end());
        return ops;
    }

    // Sum of the step costs of an alignment under this table's cost functions.
    double cost(const Alignment<T>& ops) const {
        double total = 0.0;
        for (const auto& op : ops) {
            if (op.isSubstitution()) total += costs_.substitution(*op.source, *op.dest);
            else if (op.isDeletion()) total += costs_.deletion(*op.source);
            else if (op.isInsertion()) total += costs_.insertion(*op.dest);
        }
        return total;
    }

private:
    double& cell(std::size_t row, std::size_t col) { return cells_[row * cols_ + col]; }
    double cell(std::size_t row, std::size_t col) const { return cells_[row * cols_ + col]; }

    double checked(double cost) const {
        if (cost < 0.0) throw std::invalid_argument("EditDistanceTable: negative edit cost");
        return cost;
    }
    double insertionCost(std::size_t row) const { return checked(costs_.insertion(dest_[row - 1])); }
    double deletionCost(std::size_t col) const { return checked(costs_.deletion(source_[col - 1])); }
    double substitutionCost(std::size_t row, std::size_t col) const {
        return checked(costs_.substitution(source_[col - 1], dest_[row - 1]));
    }

    void fill() {
        for (std::size_t j = 1; j < cols_; ++j) cell(0, j) = cell(0, j - 1) + deletionCost(j);
        for (std::size_t i = 1; i < rows_; ++i) cell(i, 0) = cell(i - 1, 0) + insertionCost(i);
        for (std::size_t i = 1; i < rows_; ++i) {
            for (std::size_t j = 1; j < cols_; ++j) {
                cell(i, j) = std::min({cell(i, j - 1) + deletionCost(j),
                                       cell(i - 1, j) + insertionCost(i),
                                       cell(i - 1, j - 1) + substitutionCost(i, j)});
            }
        }
    }

    std::vector<T> source_;
    std::vector<T> dest_;
    EditCosts<T> costs_;
    std::size_t rows_;
    std::size_t cols_;
    std::vector<double> cells_;
};

double editDistance(const std::string& source, const std::string& dest);
Alignment<char> alignStrings(const std::string& source, const std::string& dest);

// Unit-cost distance with early exit; returns maxCost + 1 once exceeded.
int boundedEditDistance(const std::string& a, const std::string& b, int maxCost);

struct TermSuggestion {
    Term term;
    int distance;
};

// Vocabulary terms within maxDistance of query, closest first, ties by term.
std::vector<TermSuggestion> nearestTerms(const std::vector<Term>& vocabulary,
                                         const std::string& query,
                                         int maxDistance);

} // namespace miniretrieval::algo
