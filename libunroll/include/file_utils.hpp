#ifndef UNROLL_FILE_UTILS_HPP
#define UNROLL_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace unroll {

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The directory to remove.
     * @param tag The logger tag of the caller.
     * @return true if the directory is gone afterwards.
     */
    bool cleanup_temp_dir(const std::filesystem::path& dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Exclusively owned scratch directory, removed on destruction.
     *
     * @details The directory is created as "unroll-{prefix}-{random}" inside
     * the base directory (system temp directory when empty) with a
     * non-recursive create, so an existing directory is never reused. It is
     * restricted to the owner (0700). The destructor removes the whole tree
     * regardless of how the owning scope is left.
     */
    class ScratchWorkspace {
    public:
        /**
         * @param prefix Short label included in the directory name.
         * @param base Parent directory; empty means the system temp directory.
         * @throws IngestError (Internal) if no directory can be created.
         */
        explicit ScratchWorkspace(const std::string& prefix,
                                  const std::filesystem::path& base = {});
        ~ScratchWorkspace();

        ScratchWorkspace(const ScratchWorkspace&) = delete;
        ScratchWorkspace& operator=(const ScratchWorkspace&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

} // namespace unroll

#endif // UNROLL_FILE_UTILS_HPP
