#pragma once

#include "detection/document.hpp"
#include "detection/pagePipeline.hpp"
#include "detection/wireStatistics.hpp"

#include <vector>

namespace wirescan::detection {

//! Result of a whole document run.
struct DocumentResult {
	std::vector<PageResult> pages{}; //!< One result per page, in page order.
	WireStatistics statistics{};     //!< Merged statistics of all successful pages.
	bool success{false};             //!< True if every page could be analysed.
};

/*! Run the page pipeline on every page of a document.
 *  Pages are distributed over worker threads. Each worker analyses one page at a time.
 *  The document must allow concurrent const access (see Document).
 *
 * \param [in] document    Drawing source.
 * \param [in] config      Pipeline configuration, shared by all pages.
 * \param [in] workerCount Number of worker threads. 0 picks std::thread::hardware_concurrency(). Never more than pages.
 * \return     Page results and merged statistics.
 */
DocumentResult analyseDocument(const Document& document, const PipelineConfig& config = PipelineConfig{}, unsigned workerCount = 0u);

} // namespace wirescan::detection
