#include "ftecho/server/session.hpp"

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace ftecho::server
{

    void Session::handle_list()
    {
        std::string listing;
        std::size_t count = 0;
        try
        {
            const auto entries = services_.storage.list_committed();
            count = entries.size();
            listing = ftecho::protocol::format_listing(entries);
        }
        catch (const std::exception &ex)
        {
            send_error(std::string("LIST failed: ") + ex.what());
            return;
        }

        spdlog::info("{}: listed {} files", remote_endpoint(), count);
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Ok, listing, [this, self]
                  { await_command(); });
    }

} // namespace ftecho::server
