#ifndef INCLUDE_NOPASSPLZ_STORAGE_SQLITE_SQLITEINDEXLABELREPOSITORYFACTORY_HPP
#define INCLUDE_NOPASSPLZ_STORAGE_SQLITE_SQLITEINDEXLABELREPOSITORYFACTORY_HPP

#include "nopassplz/storage/IIndexLabelRepository.hpp"
#include <filesystem>
#include <memory>

namespace nopassplz::storage::sqlite
{

// Creates the database file and its schema if missing. Throws std::runtime_error if it cannot be opened.
[[nodiscard]] std::unique_ptr<nopassplz::storage::IIndexLabelRepository>
makeSqliteIndexLabelRepository(const std::filesystem::path& dbFile);

} // namespace nopassplz::storage::sqlite

#endif // INCLUDE_NOPASSPLZ_STORAGE_SQLITE_SQLITEINDEXLABELREPOSITORYFACTORY_HPP
