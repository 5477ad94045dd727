//------------------------------------------------------------------------------
/*
    This file is part of ringsettle
    Copyright (c) 2026 the ringsettle authors

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <ringsettle/basics/Log.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <functional>
#include <iostream>

namespace ringsettle {

Logs::Sink::Sink(
    std::string const& partition,
    severities::Severity thresh,
    Logs& logs)
    : Journal::Sink(thresh, false), logs_(logs), partition_(partition)
{
}

void
Logs::Sink::write(severities::Severity level, std::string const& text)
{
    if (level < threshold())
        return;

    logs_.write(level, partition_, text, console());
}

//------------------------------------------------------------------------------

bool
Logs::File::isOpen() const noexcept
{
    return m_stream != nullptr;
}

bool
Logs::File::open(boost::filesystem::path const& path)
{
    close();

    bool wasOpened = false;

    std::unique_ptr<std::ofstream> stream(
        new std::ofstream(path.c_str(), std::fstream::app));

    if (stream->good())
    {
        m_path = path;

        m_stream = std::move(stream);

        wasOpened = true;
    }

    return wasOpened;
}

void
Logs::File::close()
{
    m_stream = nullptr;
}

void
Logs::File::writeln(std::string const& text)
{
    if (m_stream != nullptr)
    {
        (*m_stream) << text << std::endl;
    }
}

//------------------------------------------------------------------------------

Logs::Logs(severities::Severity thresh) : thresh_(thresh)
{
}

bool
Logs::open(boost::filesystem::path const& pathToLogFile)
{
    std::lock_guard lock(mutex_);
    return file_.open(pathToLogFile);
}

Journal::Sink&
Logs::get(std::string const& name)
{
    std::lock_guard lock(mutex_);
    auto const iter = sinks_.find(name);
    if (iter != sinks_.end())
        return *iter->second;
    auto const result = sinks_.emplace(name, makeSink(name, thresh_));
    return *result.first->second;
}

Journal::Sink&
Logs::operator[](std::string const& name)
{
    return get(name);
}

Journal
Logs::journal(std::string const& name)
{
    return Journal(get(name));
}

severities::Severity
Logs::threshold() const
{
    return thresh_;
}

void
Logs::threshold(severities::Severity thresh)
{
    std::lock_guard lock(mutex_);
    thresh_ = thresh;
    for (auto& sink : sinks_)
        sink.second->threshold(thresh);
}

void
Logs::write(
    severities::Severity level,
    std::string const& partition,
    std::string const& text,
    bool console)
{
    std::string s;
    format(s, text, level, partition);
    std::lock_guard lock(mutex_);
    file_.writeln(s);
    if (!silent_ || console)
        std::cerr << s << '\n';
}

std::unique_ptr<Journal::Sink>
Logs::makeSink(std::string const& name, severities::Severity threshold)
{
    return std::make_unique<Sink>(name, threshold, *this);
}

std::string
Logs::toString(severities::Severity s)
{
    using namespace severities;
    switch (s)
    {
        case kTrace:
            return "Trace";
        case kDebug:
            return "Debug";
        case kInfo:
            return "Info";
        case kWarning:
            return "Warning";
        case kError:
            return "Error";
        case kFatal:
            return "Fatal";
        default:
            break;
    }
    return "Unknown";
}

std::optional<severities::Severity>
Logs::fromString(std::string const& s)
{
    using namespace severities;
    if (boost::iequals(s, "trace"))
        return kTrace;

    if (boost::iequals(s, "debug"))
        return kDebug;

    if (boost::iequals(s, "info") || boost::iequals(s, "information"))
        return kInfo;

    if (boost::iequals(s, "warn") || boost::iequals(s, "warning") ||
        boost::iequals(s, "warnings"))
        return kWarning;

    if (boost::iequals(s, "error") || boost::iequals(s, "errors"))
        return kError;

    if (boost::iequals(s, "fatal") || boost::iequals(s, "fatals"))
        return kFatal;

    return std::nullopt;
}

void
Logs::format(
    std::string& output,
    std::string const& message,
    severities::Severity severity,
    std::string const& partition)
{
    output.reserve(message.size() + partition.size() + 100);

    output = boost::posix_time::to_simple_string(
        boost::posix_time::microsec_clock::universal_time());
    output += " UTC ";

    if (!partition.empty())
        output += partition + ":";

    using namespace severities;
    switch (severity)
    {
        case kTrace:
            output += "TRC ";
            break;
        case kDebug:
            output += "DBG ";
            break;
        case kInfo:
            output += "NFO ";
            break;
        case kWarning:
            output += "WRN ";
            break;
        case kError:
            output += "ERR ";
            break;
        default:
        case kFatal:
            output += "FTL ";
            break;
    }

    output += message;

    // Limit the maximum length of the output
    if (output.size() > maximumMessageCharacters)
    {
        output.resize(maximumMessageCharacters - 3);
        output += "...";
    }
}

//------------------------------------------------------------------------------

class DebugSink
{
private:
    std::reference_wrapper<Journal::Sink> sink_;
    std::unique_ptr<Journal::Sink> holder_;
    std::mutex m_;

public:
    DebugSink() : sink_(Journal::getNullSink())
    {
    }

    DebugSink(DebugSink const&) = delete;
    DebugSink&
    operator=(DebugSink const&) = delete;

    DebugSink(DebugSink&&) = delete;
    DebugSink&
    operator=(DebugSink&&) = delete;

    std::unique_ptr<Journal::Sink>
    set(std::unique_ptr<Journal::Sink> sink)
    {
        std::lock_guard _(m_);

        using std::swap;
        swap(holder_, sink);

        if (holder_)
            sink_ = *holder_;
        else
            sink_ = Journal::getNullSink();

        return sink;
    }

    Journal::Sink&
    get()
    {
        std::lock_guard _(m_);
        return sink_.get();
    }
};

static DebugSink&
debugSink()
{
    static DebugSink _;
    return _;
}

std::unique_ptr<Journal::Sink>
setDebugLogSink(std::unique_ptr<Journal::Sink> sink)
{
    return debugSink().set(std::move(sink));
}

Journal
debugLog()
{
    return Journal(debugSink().get());
}

}  // namespace ringsettle
