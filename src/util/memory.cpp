#include "memory.hpp"
#include <cerrno>
#include <system_error>
#include <sys/mman.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

static std::system_error errno_error(const std::string& what)
{
	return std::system_error(errno, std::generic_category(), what);
}

/**
 * This procedure mmaps a file in memory
 * @param filename
 * @return a pair containing the pointer to the mapped file and its size
 */
static std::pair<void*, size_t> mmap_helper(char const *const filename)
{
	auto fd = open(filename, O_RDONLY);
	if(fd == -1)
		throw errno_error(std::string("open ") + filename);

	// Get file's size
	struct stat st{};
	if(fstat(fd, &st) == -1)
	{
		auto err = errno_error(std::string("stat ") + filename);
		close(fd);
		throw err;
	}

	// mmap refuses zero length mappings
	if(st.st_size == 0)
	{
		close(fd);
		return {nullptr, 0};
	}

	// Map file in memory
	void* mapped = mmap(nullptr, st.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
	if(mapped == MAP_FAILED)
	{
		auto err = errno_error(std::string("mmap ") + filename);
		close(fd);
		throw err;
	}

	close(fd);

	return {mapped, st.st_size};
}

memory_mmap::memory_mmap(const std::string &filename)
{
	auto [b, s] = mmap_helper(filename.c_str());
	buff = static_cast<uint8_t *>(b);
	buff_size = s;
}

memory_mmap::~memory_mmap()
{
	release();
}

void memory_mmap::release()
{
	if(buff)
		munmap((void *) buff, buff_size);

	buff = nullptr;
	buff_size = 0;
}

std::pair<uint8_t *, size_t> memory_mmap::get() const
{
	return {buff, buff_size};
}
