///
/// \file curlwrapper.cpp
///
/// \brief
///
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "curlwrapper.h"

static size_t writeResult(void* buffer, size_t size, size_t nmemb, void* context)
{
    std::string& result = *static_cast<std::string*>(context);
    size_t const count = size * nmemb;
    result.append(static_cast<char*>(buffer), count);
    return count;
}

void CurlWrapper::setOptions(const CurlOptions & options, struct curl_slist **ppheaders)
{
    if (!m_handle) {
        throw ERROR_EXCEPTION << "internal error curl not initialized";
    }
    CURL* handle = m_handle.get();

    curl_easy_reset(handle);

    if (CURLE_OK != curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L)) {
        throw ERROR_EXCEPTION << "failed to set curl options";
    }

    if (options.debug() && CURLE_OK != curl_easy_setopt(handle, CURLOPT_VERBOSE, 1L)) {
        throw ERROR_EXCEPTION << "failed to set curl options";
    }

    if (options.transferTimeout() && CURLE_OK != curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options.transferTimeout()))) {
        throw ERROR_EXCEPTION << "failed to set curl options";
    }

    if (options.connectTimeout() && CURLE_OK != curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connectTimeout()))) {
        throw ERROR_EXCEPTION << "failed to set curl options";
    }

    if (options.isSecure()) {
        if (CURLE_OK != curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L)
            || CURLE_OK != curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L)) {
            throw ERROR_EXCEPTION << "failed to set curl secure options";
        }
        if (!options.caFile().empty() && CURLE_OK != curl_easy_setopt(handle, CURLOPT_CAINFO, options.caFile().c_str())) {
            throw ERROR_EXCEPTION << "failed to set curl cainfo";
        }
    }

    std::vector<std::pair<std::string, std::string> >::const_iterator it = options.headers().begin();
    for (/* empty */; it != options.headers().end(); ++it) {
        std::string header = it->first + ": " + it->second;
        *ppheaders = curl_slist_append(*ppheaders, header.c_str());
    }

    if (*ppheaders && CURLE_OK != curl_easy_setopt(handle, CURLOPT_HTTPHEADER, *ppheaders)) {
        throw ERROR_EXCEPTION << "failed to set curl headers";
    }

    if (CURLE_OK != curl_easy_setopt(handle, CURLOPT_URL, options.fullUrl().c_str())) {
        throw ERROR_EXCEPTION << "failed to set curl url " << options.fullUrl();
    }
}

void CurlWrapper::processCurlResponse(CURLcode curlCode, int minValidResCode, int maxValidResCode)
{
    if (CURLE_PEER_FAILED_VERIFICATION == curlCode) {
        throw ERROR_EXCEPTION << "peer verification failed - " << curl_easy_strerror(curlCode);
    } else if (CURLE_OK != curlCode) {
        throw ERROR_EXCEPTION << "request failed: (" << curlCode << ") - " << curl_easy_strerror(curlCode);
    }

    CURL* handle = m_handle.get();
    long response = 0;
    if (CURLE_OK != curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response)) {
        throw ERROR_EXCEPTION << "failed to get response code";
    }
    m_responseCode = response;

    if (!( (response >= minValidResCode) && (response <= maxValidResCode) ) ) {
        throw ERROR_EXCEPTION << "server returned error: " << response;
    }
}

void CurlWrapper::perform(const CurlOptions & options, std::string & result)
{
    CURL* handle = m_handle.get();

    if (CURLE_OK != curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeResult)
        || CURLE_OK != curl_easy_setopt(handle, CURLOPT_WRITEDATA, &result)) {
        throw ERROR_EXCEPTION << "failed to set curl options";
    }

    m_responseCode = 0;
    CURLcode curlCode = curl_easy_perform(handle);
    processCurlResponse(curlCode, options.minValidResCode(), options.maxValidResCode());
}

void CurlWrapper::get(const CurlOptions & options, std::string & result)
{
    struct curl_slist * pheaders = NULL;
    try {
        setOptions(options, &pheaders);

        if (CURLE_OK != curl_easy_setopt(m_handle.get(), CURLOPT_HTTPGET, 1L)) {
            throw ERROR_EXCEPTION << "failed to set curl options";
        }

        perform(options, result);
    }
    catch (const ErrorException &) {
        curl_slist_free_all(pheaders);
        throw;
    }
    curl_slist_free_all(pheaders);
}

void CurlWrapper::post(const CurlOptions & options, std::string const& data, std::string & result)
{
    struct curl_slist * pheaders = NULL;
    try {
        setOptions(options, &pheaders);

        CURL* handle = m_handle.get();
        if (CURLE_OK != curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(data.size()))
            || CURLE_OK != curl_easy_setopt(handle, CURLOPT_POSTFIELDS, data.c_str())) {
            throw ERROR_EXCEPTION << "failed to set curl post data";
        }

        perform(options, result);
    }
    catch (const ErrorException &) {
        curl_slist_free_all(pheaders);
        throw;
    }
    curl_slist_free_all(pheaders);
}
