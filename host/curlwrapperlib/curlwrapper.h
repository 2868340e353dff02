///
/// \file curlwrapper.h
///
/// \brief thin libcurl wrapper used for the JSON REST calls
///

#ifndef CURLWRAPPER_H
#define CURLWRAPPER_H

#include <boost/shared_ptr.hpp>
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <string>
#include <vector>
#include <utility>
#include <curl/curl.h>

#include "errorexception.h"

class CurlOptions {
public:

    explicit CurlOptions(const std::string &fullUrl) :
        m_port(0),
        m_secure(false),
        m_debug(false),
        m_timeout(300),
        m_connectTimeout(30),
        m_minValidResCode(200),
        m_maxValidResCode(299)
    {
        m_fullUrl = fullUrl;
        parseUrl(m_fullUrl);
    }

    // CURLOPT_VERBOSE - display verbose information on stderr
    // default: off
    CurlOptions& debug(const bool onoff) { m_debug = onoff; return *this; }

    // CURLOPT_TIMEOUT - maximum time in seconds the whole transfer is allowed to take
    // default: 300 secs
    CurlOptions& transferTimeout(const int secs) { m_timeout = secs ; return *this; }

    // CURLOPT_CONNECTTIMEOUT - maximum time in seconds for the connect phase
    // default: 30 secs
    CurlOptions& connectTimeout(const int secs) { m_connectTimeout = secs ; return *this; }

    // Set the range of valid response codes [min:max] for curl operation
    // responses outside the range throw
    // default : [200:299]
    CurlOptions & validResponseRange(int min, int  max)  {
        if(max  < min ) {
            throw ERROR_EXCEPTION << "invalid inputs" << " min:" << min << " max:" << max;
        }
        m_minValidResCode = min ; m_maxValidResCode = max;
        return *this;
    }

    // Set ca File
    // default : empty string, system bundle
    CurlOptions & caFile(const std::string& caFile){ m_caFile = caFile; return *this; }

    // Add a request header, e.g. header("Accept", "application/json")
    CurlOptions & header(const std::string& name, const std::string& value)
    {
        m_headers.push_back(std::make_pair(name, value));
        return *this;
    }

    std::string server() const {return m_server ; }
    int port() const {return m_port ; }
    std::string partialUrl() const { return m_partialurl; }
    std::string parameters() const { return m_parameters; }
    bool isSecure() const {return m_secure;}
    std::string fullUrl() const {return m_fullUrl ; }
    bool debug() const { return m_debug ; }

    int transferTimeout()  const { return m_timeout ; }
    int connectTimeout()  const { return m_connectTimeout ; }

    int minValidResCode() const {return m_minValidResCode;}
    int maxValidResCode() const {return m_maxValidResCode;}

    std::string caFile() const {return m_caFile;}

    const std::vector<std::pair<std::string, std::string> >& headers() const { return m_headers; }

private:

    void parseUrl(const std::string & fullUrl) {

        //                         protocol       server          port          path        parameters
        boost::regex urlExpression("^(https?)://([^/?#:]+)(?::(\\d+))?(/[^?#]*)?(?:\\?([^#]*))?$",
            boost::regex::icase);

        boost::smatch fields;
        if (!boost::regex_match(fullUrl, fields, urlExpression)) {
            throw ERROR_EXCEPTION << "invalid url " << fullUrl;
        }

        m_secure = boost::iequals(fields.str(1), std::string("https"));
        m_server = fields.str(2);
        if (fields[3].matched) {
            m_port = boost::lexical_cast<int>(fields.str(3));
        }
        else {
            m_port = m_secure ? 443 : 80;
        }
        m_partialurl = fields[4].matched ? fields.str(4) : std::string("/");
        m_parameters = fields.str(5);
    }

    std::string m_server;
    int m_port;
    std::string m_partialurl;
    std::string m_parameters;
    bool m_secure;
    std::string m_fullUrl;
    bool m_debug;

    int m_timeout;
    int m_connectTimeout;

    int m_minValidResCode;
    int m_maxValidResCode;

    std::string m_caFile;

    std::vector<std::pair<std::string, std::string> > m_headers;
};


class CurlWrapper {
public:
    CurlWrapper()
        :m_handle( curl_easy_init(), curl_easy_cleanup ),
         m_responseCode(0)
    {
    }

    /// \brief issues a GET, the body is returned in result
    void get(const CurlOptions & options, std::string & result);

    /// \brief issues a POST of data, the body is returned in result
    void post(const CurlOptions & options, std::string const& data, std::string & result);

    /// \brief HTTP status of the last completed request
    long responseCode() const { return m_responseCode; }

protected:
    void setOptions(const CurlOptions & options, struct curl_slist **ppheaders);
    void perform(const CurlOptions & options, std::string & result);
    void processCurlResponse(CURLcode curlCode, int minValidResCode, int maxValidResCode);

private:
    boost::shared_ptr<CURL> m_handle;
    long m_responseCode;
};

#endif // CURLWRAPPER_H
