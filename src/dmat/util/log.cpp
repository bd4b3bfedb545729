#include <dmat/util/log.hpp>

#include <ctime>
#include <iostream>
#include <stdexcept>

namespace dmat
{

namespace
{
	log::level_e current_threshold = log::WARNING;
	std::ostream* current_sink = &std::cerr;
}

log::log(const std::string& _facility, const level_e _l)
	: facility(_facility)
	, l(_l)
	, os()
{}

log::~log()
{
	if(enabled())
		sink() << os.str() << std::endl;
}

std::ostream& log::operator()()
{
	char time_str[80];
	std::time_t t = std::time(NULL);
	std::strftime(time_str, 80, "%F %T", std::localtime(&t));

	os << time_str << " [" << facility << "] " << to_string(l) << ": ";
	return os;
}

void log::set_threshold(const level_e l)
{
	current_threshold = l;
}

log::level_e log::threshold()
{
	return current_threshold;
}

void log::set_sink(std::ostream& sink)
{
	current_sink = &sink;
}

std::ostream& log::sink()
{
	return *current_sink;
}

bool log::enabled() const
{
	return l >= current_threshold;
}

std::string to_string(const log::level_e l)
{
	switch(l)
	{
	case log::DEBUG:
		return "debug";
	case log::NOTICE:
		return "notice";
	case log::WARNING:
		return "warning";
	case log::ERROR:
		return "error";
	default:
		throw std::logic_error("Unknown log level");
	}
}

}
