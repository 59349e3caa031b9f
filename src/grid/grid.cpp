#include <planwise/grid/Grid.hpp>

#include <algorithm>
#include <cctype>

namespace planwise::grid {

namespace {

bool starts_with_nocase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        const auto a = std::tolower(static_cast<unsigned char>(s[i]));
        const auto b = std::tolower(static_cast<unsigned char>(prefix[i]));
        if (a != b) return false;
    }
    return true;
}

void add_slots(const std::vector<std::optional<std::string>>& slots, eval::CodeSet& out) {
    for (const auto& s : slots) {
        if (s.has_value()) out.insert(*s);
    }
}

} // namespace

std::optional<Term> term_of(std::string_view semester_id) {
    if (starts_with_nocase(semester_id, "fall")) return Term::kFall;
    if (starts_with_nocase(semester_id, "winter")) return Term::kWinter;
    return std::nullopt;
}

const char* term_name(Term t) {
    return t == Term::kFall ? "Fall" : "Winter";
}

SemesterOrder default_semester_order(uint32_t years) {
    SemesterOrder out{};
    out.reserve(static_cast<size_t>(years) * 2);
    for (uint32_t y = 1; y <= years; ++y) {
        out.push_back("fall-" + std::to_string(y));
        out.push_back("winter-" + std::to_string(y));
    }
    return out;
}

std::optional<size_t> position_of(const SemesterOrder& order, std::string_view semester_id) {
    const auto it = std::find(order.begin(), order.end(), semester_id);
    if (it == order.end()) return std::nullopt;
    return static_cast<size_t>(it - order.begin());
}

void PlanGrid::init_semesters(const SemesterOrder& ids) {
    for (const auto& id : ids) {
        state_.insert_or_assign(id, Slots(slots_per_semester_));
    }
}

PlanGrid::Slots* PlanGrid::slots_for_(std::string_view semester_id, diag::Bag& diags) {
    const auto it = state_.find(semester_id);
    if (it == state_.end()) {
        diags.error(diag::Code::G_UNKNOWN_SEMESTER, std::string(semester_id), "no such semester in the plan");
        return nullptr;
    }
    return &it->second;
}

bool PlanGrid::add_course(std::string_view semester_id, uint32_t slot, std::string_view code, diag::Bag& diags) {
    Slots* slots = slots_for_(semester_id, diags);
    if (slots == nullptr) return false;

    if (slot >= slots->size()) {
        diags.error(diag::Code::G_SLOT_OUT_OF_RANGE, std::string(semester_id),
                    "slot " + std::to_string(slot) + " is out of range");
        return false;
    }
    if (const auto existing = find_course(code); existing.has_value()) {
        diags.error(diag::Code::G_DUPLICATE_PLACEMENT, std::string(code),
                    "course is already placed in " + existing->semester_id);
        return false;
    }
    if ((*slots)[slot].has_value()) {
        diags.error(diag::Code::G_SLOT_OCCUPIED, std::string(semester_id),
                    "slot " + std::to_string(slot) + " already holds " + *(*slots)[slot]);
        return false;
    }

    (*slots)[slot] = std::string(code);
    return true;
}

bool PlanGrid::remove_course(std::string_view semester_id, uint32_t slot, diag::Bag& diags) {
    Slots* slots = slots_for_(semester_id, diags);
    if (slots == nullptr) return false;
    if (slot >= slots->size()) {
        diags.error(diag::Code::G_SLOT_OUT_OF_RANGE, std::string(semester_id),
                    "slot " + std::to_string(slot) + " is out of range");
        return false;
    }
    (*slots)[slot].reset();
    return true;
}

bool PlanGrid::move_course(std::string_view from_semester,
                           uint32_t from_slot,
                           std::string_view to_semester,
                           uint32_t to_slot,
                           diag::Bag& diags) {
    Slots* from = slots_for_(from_semester, diags);
    Slots* to = slots_for_(to_semester, diags);
    if (from == nullptr || to == nullptr) return false;

    if (from_slot >= from->size() || to_slot >= to->size()) {
        diags.error(diag::Code::G_SLOT_OUT_OF_RANGE, std::string(to_semester), "move refers to a slot out of range");
        return false;
    }
    if (from == to && from_slot == to_slot) return true;
    if ((*to)[to_slot].has_value()) {
        diags.error(diag::Code::G_SLOT_OCCUPIED, std::string(to_semester),
                    "slot " + std::to_string(to_slot) + " already holds " + *(*to)[to_slot]);
        return false;
    }

    (*to)[to_slot] = std::move((*from)[from_slot]);
    (*from)[from_slot].reset();
    return true;
}

bool PlanGrid::place(std::string_view semester_id, std::string_view code, diag::Bag& diags) {
    Slots* slots = slots_for_(semester_id, diags);
    if (slots == nullptr) return false;
    for (uint32_t i = 0; i < slots->size(); ++i) {
        if (!(*slots)[i].has_value()) return add_course(semester_id, i, code, diags);
    }
    diags.error(diag::Code::G_SLOT_OCCUPIED, std::string(semester_id),
                "no free slot left for " + std::string(code));
    return false;
}

std::optional<Placement> PlanGrid::find_course(std::string_view code) const {
    for (const auto& [sem, slots] : state_) {
        for (uint32_t i = 0; i < slots.size(); ++i) {
            if (slots[i].has_value() && *slots[i] == code) {
                return Placement{sem, i, *slots[i]};
            }
        }
    }
    return std::nullopt;
}

eval::CodeSet PlanGrid::collect_through_(const SemesterOrder& order,
                                         std::string_view semester_id,
                                         bool inclusive) const {
    eval::CodeSet out{};
    const auto target = position_of(order, semester_id);
    if (!target.has_value()) return out;

    const size_t end = inclusive ? *target + 1 : *target;
    for (size_t i = 0; i < end; ++i) {
        const auto it = state_.find(order[i]);
        if (it == state_.end()) continue;
        add_slots(it->second, out);
    }
    return out;
}

eval::CodeSet PlanGrid::placed_before(const SemesterOrder& order, std::string_view semester_id) const {
    return collect_through_(order, semester_id, false);
}

eval::CodeSet PlanGrid::placed_up_to(const SemesterOrder& order, std::string_view semester_id) const {
    return collect_through_(order, semester_id, true);
}

eval::CodeSet PlanGrid::placed_anywhere() const {
    eval::CodeSet out{};
    for (const auto& [_, slots] : state_) add_slots(slots, out);
    return out;
}

std::vector<Placement> PlanGrid::placements(const SemesterOrder& order) const {
    std::vector<Placement> out{};
    auto push_semester = [&](const std::string& sem, const Slots& slots) {
        for (uint32_t i = 0; i < slots.size(); ++i) {
            if (slots[i].has_value()) out.push_back(Placement{sem, i, *slots[i]});
        }
    };

    for (const auto& sem : order) {
        const auto it = state_.find(sem);
        if (it != state_.end()) push_semester(it->first, it->second);
    }
    for (const auto& [sem, slots] : state_) {
        if (position_of(order, sem).has_value()) continue;
        push_semester(sem, slots);
    }
    return out;
}

} // namespace planwise::grid
