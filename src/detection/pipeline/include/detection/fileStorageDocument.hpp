#pragma once

#include "detection/document.hpp"

#include <opencv2/core/persistence.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wirescan::detection {

/*! Document read from a YAML or JSON file through cv::FileStorage.
 *
 *  Layout:
 *  \code
 *  pages:
 *     - { width: 800, height: 600,
 *         drawings: [ { stroke: [1, 0, 0], fill: [0, 0, 1], width: 1,
 *                       items: [ { cmd: l, points: [10, 20, 300, 20] } ] } ] }
 *  \endcode
 *  Colors are RGB in [0, 1]. Points are flat coordinate lists (x0, y0, x1, y1, ...).
 *  Commands: l (line), m (move), c (curve), re (rectangle), qu (quad). Other commands and unreadable operands become
 *  PathCommand::Unsupported items.
 */
class FileStorageDocument : public Document {
public:
	//! Load a document file. Nullopt (and an error message) if the file can not be read or has no valid page list.
	static std::optional<FileStorageDocument> load(const std::filesystem::path& path);

	//! Parse a document held in memory (YAML or JSON text).
	static std::optional<FileStorageDocument> fromString(const std::string& content);

	std::size_t pageCount() const override;
	std::optional<PageSize> pageSize(std::size_t page) const override;
	std::vector<Drawing> drawings(std::size_t page) const override;

private:
	struct Page {
		PageSize size{};
		std::vector<Drawing> drawings{};
	};

	static std::optional<FileStorageDocument> parse(const cv::FileNode& root, const std::string& source);

private:
	std::vector<Page> m_pages{};
};

} // namespace wirescan::detection
