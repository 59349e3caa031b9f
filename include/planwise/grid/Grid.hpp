#pragma once

#include <planwise/diag/DiagCode.hpp>
#include <planwise/eval/Evaluator.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace planwise::grid {

enum class Term : uint8_t {
    kFall,
    kWinter,
};

/// Derives the term from a semester id prefix ("fall-2" -> Fall).
std::optional<Term> term_of(std::string_view semester_id);
const char* term_name(Term t);

using SemesterOrder = std::vector<std::string>;

/// fall-1, winter-1, ..., fall-N, winter-N
SemesterOrder default_semester_order(uint32_t years);

/// Index of `semester_id` in `order`, or nullopt.
std::optional<size_t> position_of(const SemesterOrder& order, std::string_view semester_id);

struct Placement {
    std::string semester_id{};
    uint32_t slot = 0;
    std::string code{};
};

/// The three derived views the validator reads, plus slot enumeration.
class GridView {
public:
    virtual ~GridView() = default;

    virtual eval::CodeSet placed_before(const SemesterOrder& order, std::string_view semester_id) const = 0;
    virtual eval::CodeSet placed_up_to(const SemesterOrder& order, std::string_view semester_id) const = 0;
    virtual eval::CodeSet placed_anywhere() const = 0;

    /// Occupied slots, semesters in `order` first, then slot index.
    virtual std::vector<Placement> placements(const SemesterOrder& order) const = 0;
};

/// Semester-slotted plan. A course occupies at most one slot in the
/// whole grid.
class PlanGrid final : public GridView {
public:
    explicit PlanGrid(uint32_t slots_per_semester = 5)
        : slots_per_semester_(slots_per_semester == 0 ? 1 : slots_per_semester) {}

    void init_semesters(const SemesterOrder& ids);

    bool add_course(std::string_view semester_id, uint32_t slot, std::string_view code, diag::Bag& diags);
    bool remove_course(std::string_view semester_id, uint32_t slot, diag::Bag& diags);
    bool move_course(std::string_view from_semester,
                     uint32_t from_slot,
                     std::string_view to_semester,
                     uint32_t to_slot,
                     diag::Bag& diags);

    /// Places `code` in the first free slot of `semester_id`.
    bool place(std::string_view semester_id, std::string_view code, diag::Bag& diags);

    std::optional<Placement> find_course(std::string_view code) const;

    uint32_t slots_per_semester() const { return slots_per_semester_; }

    eval::CodeSet placed_before(const SemesterOrder& order, std::string_view semester_id) const override;
    eval::CodeSet placed_up_to(const SemesterOrder& order, std::string_view semester_id) const override;
    eval::CodeSet placed_anywhere() const override;
    std::vector<Placement> placements(const SemesterOrder& order) const override;

private:
    using Slots = std::vector<std::optional<std::string>>;

    Slots* slots_for_(std::string_view semester_id, diag::Bag& diags);
    eval::CodeSet collect_through_(const SemesterOrder& order, std::string_view semester_id, bool inclusive) const;

    uint32_t slots_per_semester_ = 5;
    std::map<std::string, Slots, std::less<>> state_{};
};

} // namespace planwise::grid
