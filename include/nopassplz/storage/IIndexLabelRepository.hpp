#ifndef INCLUDE_NOPASSPLZ_STORAGE_IINDEXLABELREPOSITORY_HPP
#define INCLUDE_NOPASSPLZ_STORAGE_IINDEXLABELREPOSITORY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nopassplz::storage
{

// Non-secret metadata shown next to an index. Never holds key material.
struct IndexLabel final
{
    std::string title{};
    std::string description{};
    bool exposed{ false };

    friend bool operator==(const IndexLabel&, const IndexLabel&) = default;
};

struct LabeledIndex final
{
    std::uint32_t index{};
    IndexLabel label{};

    friend bool operator==(const LabeledIndex&, const LabeledIndex&) = default;
};

class IIndexLabelRepository
{
public:
    IIndexLabelRepository() = default;
    IIndexLabelRepository(const IIndexLabelRepository&) = delete;
    IIndexLabelRepository& operator=(const IIndexLabelRepository&) = delete;
    IIndexLabelRepository(IIndexLabelRepository&&) = delete;
    IIndexLabelRepository& operator=(IIndexLabelRepository&&) = delete;
    virtual ~IIndexLabelRepository() = default;

    [[nodiscard]] virtual std::optional<IndexLabel> load(std::uint32_t index) const = 0;

    // Inserts or replaces. Throws std::invalid_argument if the title is empty.
    virtual void store(std::uint32_t index, const IndexLabel& label) = 0;

    // Returns true if a row was deleted, false if it was not found.
    [[nodiscard]] virtual bool remove(std::uint32_t index) = 0;

    // Labels for indices in [offset, offset + limit), ordered by index. Unlabeled indices are absent.
    [[nodiscard]] virtual std::vector<LabeledIndex> list(std::uint32_t offset, std::size_t limit) const = 0;
};

} // namespace nopassplz::storage

#endif // INCLUDE_NOPASSPLZ_STORAGE_IINDEXLABELREPOSITORY_HPP
