#include <dismay/report/errc.hpp>

#include <string>

namespace dismay
{
namespace
{
class dismay_error_category final : public std::error_category
{
public:
    [[nodiscard]] auto name() const noexcept -> char const * override
    {
        return "dismay";
    }

    [[nodiscard]] auto message(int errval) const -> std::string override
    {
        switch (errc{errval})
        {
        case errc::hook_already_installed:
            return "a hook has already been installed";

        case errc::spawn_failed:
            return "the child process could not be spawned";

        case errc::not_supported:
            return "the requested feature is not supported";

        default:
            return "unknown dismay error code: #" + std::to_string(errval);
        }
    }
};

dismay_error_category const gCategory;
} // namespace

auto dismay_category() noexcept -> std::error_category const &
{
    return gCategory;
}

} // namespace dismay
