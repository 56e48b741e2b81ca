#pragma once

#include <memory>
#include <string>

#include "ascmedia/client/app_store_api.hpp"
#include "ascmedia/client/config.hpp"
#include "ascmedia/client/http_transport.hpp"
#include "ascmedia/client/jwt.hpp"
#include "ascmedia/logger.hpp"
#include "ascmedia/media_sync.hpp"

namespace ascmedia::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        void connect();
        bool ask_yes_no(const std::string &question) const;
        static std::string prompt_line(const std::string &label);
        int dispatch();

        int handle_configure();
        int handle_upload();
        int handle_download();
        int handle_verify();

        TransferOptions transfer_options() const;
        int finish(const OperationSummary &summary);

        ClientConfig config_;
        Logger logger_;
        std::unique_ptr<TokenSigner> signer_;
        std::unique_ptr<HttpTransport> transport_;
        std::unique_ptr<AppStoreMediaApi> api_;
    };

} // namespace ascmedia::client
