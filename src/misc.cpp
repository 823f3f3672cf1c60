#include "misc.hpp"

#include <time.h>
#include <sys/time.h>

/****************************************************************************
 * safeGetline
 * - Works the same as getline, however, can handle issues where the end of
 * line tokens might be either '\n', '\r', or '\n\r'.
 *****************************************************************************/
istream& safeGetline(istream& is, string& t)
{
	t.clear();

	// The characters in the stream are read one-by-one using a std::streambuf.
	// Code that uses streambuf this way must be guarded by a sentry object.
	std::istream::sentry se(is, true);
	std::streambuf* sb = is.rdbuf();

	for(;;) {
		int c = sb->sbumpc();
		switch (c) {
		case '\n':
			return is;
		case '\r':
			if(sb->sgetc() == '\n')
				sb->sbumpc();
			return is;
		case std::streambuf::traits_type::eof():
			// Also handle the case when the last line has no line ending
			if(t.empty())
				is.setstate(std::ios::eofbit);
			return is;
		default:
			t += (char)c;
		}
	}
}

/* The subroutine splits the line of type string along the delimiters into a vector of shorter strings */
vector<string> splitString(string &line, char delimiter) {

	stringstream ss(line);
	string item;
	vector<string> tokens;
	while (getline(ss, item, delimiter)) {
		tokens.push_back(item);
	}
	// a trailing delimiter closes an empty field
	if (!line.empty() && line[line.size()-1] == delimiter)
		tokens.push_back("");

	return tokens;
}//END splitString()

string trim (const string &str) {
	const char *ws = " \t\r\n";
	size_t begin = str.find_first_not_of(ws);
	if (begin == string::npos)
		return "";
	size_t end = str.find_last_not_of(ws);
	return str.substr(begin, end - begin + 1);
}

/* Converts the complete field into a double, false if any part of it is not numeric */
bool parseDouble (const string &str, double &value) {
	string field = trim(str);
	if (field.empty())
		return false;

	char *end;
	value = strtod(field.c_str(), &end);
	return *end == '\0' && std::isfinite(value);
}

bool open_file (ifstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

bool open_file (ofstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

bool file_exists (string filename) {
	ifstream fptr( filename.c_str() );
	return fptr.good();
}

/* 9000.5 -> "9,000.50" for precision 2 */
string formatThousands (double value, int precision) {
	ostringstream ss;
	ss << fixed << setprecision(precision) << fabs(value);
	string digits = ss.str();

	size_t point = digits.find('.');
	string intPart = digits.substr(0, point);
	string fracPart = (point == string::npos) ? "" : digits.substr(point);

	string grouped;
	int count = 0;
	for (int i = (int)intPart.size()-1; i >= 0; i--) {
		grouped.insert(grouped.begin(), intPart[i]);
		if (++count % 3 == 0 && i > 0)
			grouped.insert(grouped.begin(), ',');
	}

	return (value < 0 ? "-" : "") + grouped + fracPart;
}

// Get current date/time, format is YYYY-MM-DD.HH:mm:ss
const std::string getCurrentDateTime() {
	time_t     now = time(0);
	struct tm  tstruct;
	char       buf[80];
	tstruct = *localtime(&now);
	strftime(buf, sizeof(buf), "%Y-%m-%d %X", &tstruct);

	return buf;
}

// Get the wall time
double get_wall_time(){
	struct timeval time;
	if (gettimeofday(&time,NULL)){
		return 0;
	}
	return (double)time.tv_sec + (double)time.tv_usec * .000001;
}
