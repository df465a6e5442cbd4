#include "http_response.hpp"
#include "../../util/logger.hpp"

namespace resumable::http{

    void http_response::set_status(uint16_t status_code){
        status_code_ = status_code;
    }

    void http_response::set_status(status status_code){
        status_code_ = static_cast<uint16_t>(status_code);
    }

    void http_response::set_reason_phrase(const std::string& reason){
        reason_phrase_ = reason;
    }

    int http_response::get_status_code() const{
        return status_code_;
    }

    const std::string& http_response::get_reason_phrase() const{
        return reason_phrase_;
    }

    bool http_response::is_ok() const{
        return status_code_>=200 && status_code_<300;
    }

    bool http_response::is_redirect_response() const{
        switch(static_cast<status>(status_code_)){
            case status::moved_permanently:
            case status::moved_temporarily:
            case status::see_other:
            case status::temporary_redirect:
            case status::permanent_redirect:
                return true;
            default:
                return false;
        }
    }

    bool http_response::has_body(bool head_request) const{
        if(head_request) return false;
        if(status_code_<200) return false;
        return status_code_!=static_cast<uint16_t>(status::no_content) &&
               status_code_!=static_cast<uint16_t>(status::not_modified);
    }

    void http_response::log(const char* scope) const{
        LOG_DEBUG("[{}] HTTP/{}.{} {} {}", scope, get_http_version_major(), get_http_version_minor(),
                  status_code_, reason_phrase_);
        headers::log(scope);
    }

}
