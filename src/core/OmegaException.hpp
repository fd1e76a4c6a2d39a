//
// Created by Malik T on 13/08/2025.
//

#ifndef CARDROOM_OMEGAEXCEPTION_HPP
#define CARDROOM_OMEGAEXCEPTION_HPP

#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace cardroom::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc}
        {
        }

        [[nodiscard]]
        auto what() -> std::string& { return err_str_; }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        auto data() -> T& { return usr_data_; }
        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            return fmt::format("{}({}:{}), function `{}`", src_loc_.file_name(), src_loc_.line(),
                               src_loc_.column(), src_loc_.function_name());
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
    };
}

//extension to fmt to allow use with fmt::format and spdlog
template <class T>
struct fmt::formatter<cardroom::core::OmegaException<T>> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(cardroom::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = fmt::format("Failed to process with code ({}): {}\n{}\n", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //CARDROOM_OMEGAEXCEPTION_HPP
