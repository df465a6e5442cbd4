#include "http_request.hpp"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include "../../util/logger.hpp"

namespace resumable::http{

    namespace method_strings{
        const std::string GET       = "GET";
        const std::string HEAD      = "HEAD";
        const std::string POST      = "POST";
        const std::string PUT       = "PUT";
        const std::string DELETE    = "DELETE";
        const std::string PATCH     = "PATCH";
        const std::string OPTIONS   = "OPTIONS";
    }

    const std::string& get_method_string(method m){
        switch(m){
            case method::GET:
                return method_strings::GET;
            case method::HEAD:
                return method_strings::HEAD;
            case method::POST:
                return method_strings::POST;
            case method::PUT:
                return method_strings::PUT;
            case method::DELETE:
                return method_strings::DELETE;
            case method::PATCH:
                return method_strings::PATCH;
            case method::OPTIONS:
                return method_strings::OPTIONS;
        }
        return method_strings::GET;
    }

    bool http_request::set_url(const std::string& url){
        auto scheme_end = url.find("://");
        if(scheme_end==std::string::npos) return false;

        std::string scheme = boost::algorithm::to_lower_copy(url.substr(0, scheme_end));
        bool ssl;
        if(scheme=="http"){
            ssl = false;
        }else if(scheme=="https"){
            ssl = true;
        }else{
            return false;
        }

        std::string rest = url.substr(scheme_end + 3);
        auto authority_end = rest.find_first_of("/?#");
        std::string authority = rest.substr(0, authority_end);
        std::string target = authority_end==std::string::npos ? "" : rest.substr(authority_end);

        // fragments are never sent to the server
        auto fragment = target.find('#');
        if(fragment!=std::string::npos) target.erase(fragment);
        if(target.empty() || target[0]!='/') target.insert(0, "/");

        // drop any userinfo
        auto at = authority.rfind('@');
        if(at!=std::string::npos) authority.erase(0, at + 1);

        std::string host;
        std::string port;
        if(!authority.empty() && authority[0]=='['){
            // IPv6 literal
            auto close = authority.find(']');
            if(close==std::string::npos) return false;
            host = authority.substr(1, close - 1);
            if(close + 1 < authority.size()){
                if(authority[close + 1]!=':') return false;
                port = authority.substr(close + 2);
            }
        }else{
            auto colon = authority.rfind(':');
            host = authority.substr(0, colon);
            if(colon!=std::string::npos) port = authority.substr(colon + 1);
        }

        if(host.empty()) return false;
        if(port.empty()){
            port = ssl ? "443" : "80";
        }else if(!std::all_of(port.begin(), port.end(), [](char c){ return c>='0' && c<='9'; })){
            return false;
        }

        url_ = url;
        host_ = std::move(host);
        port_ = std::move(port);
        uri_ = std::move(target);
        ssl_ = ssl;
        return true;
    }

    void http_request::set_method(method m){
        method_ = m;
    }

    method http_request::get_method() const{
        return method_;
    }

    const std::string& http_request::get_url() const{
        return url_;
    }

    const std::string& http_request::get_host() const{
        return host_;
    }

    const std::string& http_request::get_port() const{
        return port_;
    }

    const std::string& http_request::get_uri() const{
        return uri_;
    }

    bool http_request::is_ssl() const{
        return ssl_;
    }

    std::string http_request::get_base_path() const{
        std::string base = ssl_ ? "https://" : "http://";
        base += host_.find(':')!=std::string::npos ? "[" + host_ + "]" : host_;
        if(port_!=(ssl_ ? "443" : "80")){
            base += ":" + port_;
        }
        return base;
    }

    std::string http_request::to_string() const{
        std::string out;
        out.reserve(256);
        out += get_method_string(method_);
        out += ' ';
        out += uri_;
        out += " HTTP/1.1";
        out += misc_strings::crlf;

        if(!has_header(header::host)){
            out += header::host;
            out += misc_strings::name_value_separator;
            out += host_.find(':')!=std::string::npos ? "[" + host_ + "]" : host_;
            if(port_!=(ssl_ ? "443" : "80")){
                out += ":" + port_;
            }
            out += misc_strings::crlf;
        }

        for(const auto& t: headers_){
            out += t.first;
            out += misc_strings::name_value_separator;
            out += t.second;
            out += misc_strings::crlf;
        }
        out += misc_strings::crlf;
        return out;
    }

    void http_request::log(const char* scope) const{
        LOG_DEBUG("[{}] {} {}", scope, get_method_string(method_), url_);
        headers::log(scope);
    }

}
