#pragma once

#include <cstdint>
#include <utility>
#include <cstddef>
#include <string>

/**
 * Read only mapping of a whole file. An empty file maps to {nullptr, 0}
 */
class memory_mmap
{
	uint8_t *buff = nullptr;
	size_t buff_size = 0;
public:
	/** @throws std::system_error if the file can't be opened or mapped */
	explicit memory_mmap(const std::string& filename);
	memory_mmap(const memory_mmap&) = delete;
	~memory_mmap();

	/** Unmaps the file, get() returns {nullptr, 0} afterwards */
	void release();
	std::pair<uint8_t *, size_t> get() const;
};
