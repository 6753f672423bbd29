#include "detection/documentAnalysis.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <iostream>
#include <system_error>
#include <thread>
#include <vector>

namespace wirescan::detection {

static unsigned chooseWorkerCount(const unsigned requested, const std::size_t pageCount) {
	unsigned workers = requested;
	if (workers == 0u) {
		workers = std::max(1u, std::thread::hardware_concurrency());
	}
	return static_cast<unsigned>(std::min<std::size_t>(workers, pageCount));
}

DocumentResult analyseDocument(const Document& document, const PipelineConfig& config, const unsigned workerCount) {
	DocumentResult result{};
	const std::size_t pageCount = document.pageCount();
	result.pages.resize(pageCount);

	// Each page slot is written by exactly one worker.
	std::atomic<std::size_t> nextPage{0};
	const auto worker = [&]() {
		for (std::size_t page = nextPage.fetch_add(1u); page < pageCount; page = nextPage.fetch_add(1u)) {
			result.pages[page] = analysePage(document, page, config);
		}
	};

	const unsigned workers = chooseWorkerCount(workerCount, pageCount);
	if (workers <= 1u) {
		worker();
	} else {
		// std::jthread joins on destruction, also when starting a later worker throws.
		std::vector<std::jthread> threads;
		threads.reserve(workers);
		try {
			for (unsigned i = 0; i < workers; ++i) {
				threads.emplace_back(worker);
			}
		} catch (const std::system_error& e) {
			std::cerr << "[Error] Started " << threads.size() << " of " << workers << " analysis workers: " << e.what() << std::endl;
			worker(); // Remaining pages on the calling thread.
		}
		threads.clear();
	}

	result.success = true;
	for (const auto& page: result.pages) {
		if (!page.success) {
			result.success = false;
			continue;
		}
		merge(result.statistics, page.statistics);
	}
	return result;
}

} // namespace wirescan::detection
