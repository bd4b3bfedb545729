#pragma once

#include <iosfwd>
#include <string>
#include <sstream>

namespace dmat
{

class log
{
public:
	enum level_e
	{
		DEBUG,
		NOTICE,
		WARNING,
		ERROR
	};

	log(const std::string& facility, const level_e l);
	~log();

	log(log&) = delete;
	void operator=(log&) = delete;

	std::ostream& operator()();

	/* Messages below the threshold are dropped; defaults to WARNING. */
	static void set_threshold(const level_e l);
	static level_e threshold();

	/* Where flushed messages end up; defaults to std::cerr. */
	static void set_sink(std::ostream& sink);
	static std::ostream& sink();

	bool enabled() const;

private:
	std::string facility;
	level_e l;

	std::ostringstream os;
};

std::string to_string(const log::level_e l);

}
