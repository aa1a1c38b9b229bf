#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include "dice.h"
#include "dictionary.h"
#include "errors.h"
#include "generate.h"
#include "grid.h"
#include "search.h"

namespace py = pybind11;
using std::string;
using std::vector;

namespace {

PyObject* exhausted_type = nullptr;

py::object logger() {
    return py::module_::import("logging").attr("getLogger")("boggle_cpp");
}

void log_loaded(const boggle::Dictionary& d, const string& what) {
    logger().attr("info")("loaded %s: %d words, %d nodes", what, d.num_words(), d.num_nodes());
}

vector<string> sorted_words(const boggle::WordSet& ws) {
    return vector<string>(ws.words.begin(), ws.words.end());
}

boggle::WordSet restore_py(const boggle::Dictionary& dict, const string& board, int width, int height,
                           const boggle::ScoreTable& scores, int min_legal) {
    py::gil_scoped_release release;
    return boggle::restore(dict, scores, height, width, board, min_legal);
}

py::tuple fill_board_py(const boggle::Dictionary& dict, const vector<boggle::Die>& dice,
                        const boggle::ScoreTable& scores, int width, int height,
                        int min_words, int max_words, int min_score, int max_score,
                        int min_longest, int max_longest, int min_legal, int max_tries,
                        uint32_t random_seed) {
    boggle::GenerateOptions opts;
    opts.min_words = min_words;
    opts.max_words = max_words;
    opts.min_score = min_score;
    opts.max_score = max_score;
    opts.min_longest = min_longest;
    opts.max_longest = max_longest;
    opts.min_legal = min_legal;
    opts.max_tries = max_tries;
    opts.seed = random_seed;

    boggle::GenerateResult r;
    {
        py::gil_scoped_release release;
        r = boggle::generate(dict, dice, scores, height, width, opts);
    }
    logger().attr("debug")("seed %d: accepted board %s after %d tries", random_seed, r.grid.faces, r.tries);
    return py::make_tuple(r.grid.faces, r.words, r.tries);
}

py::tuple dice_set_tuple(const boggle::DiceSet& s) {
    return py::make_tuple(s.name, s.desc, s.size, s.dice);
}

}  // namespace

PYBIND11_MODULE(boggle_cpp, m) {
    m.doc() = "Boggle board solver and constrained board generator";

    auto& base = py::register_exception<boggle::BoggleError>(m, "BoggleError");
    py::register_exception<boggle::InvalidWordListError>(m, "InvalidWordListError", base.ptr());
    py::register_exception<boggle::InvalidDiceStringError>(m, "InvalidDiceStringError", base.ptr());
    py::register_exception<boggle::InvalidScoreTableError>(m, "InvalidScoreTableError", base.ptr());
    auto& exhausted = py::register_exception<boggle::BoardGenerationExhaustedError>(
        m, "BoardGenerationExhaustedError", base.ptr());
    exhausted_type = exhausted.ptr();

    // Registered last so it runs first: attaches the attempt count.
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const boggle::BoardGenerationExhaustedError& e) {
            py::object err = py::reinterpret_borrow<py::object>(exhausted_type)(e.what());
            err.attr("attempts") = e.attempts();
            PyErr_SetObject(exhausted_type, err.ptr());
        }
    });

    py::class_<boggle::Dictionary>(m, "Dictionary")
        .def(py::init([](const string& path) {
                 auto d = boggle::Dictionary::from_file(path);
                 log_loaded(d, path);
                 return d;
             }),
             py::arg("dict_path"), "Load a word list, one word per line")
        .def_static("from_words", [](const vector<string>& words) {
                 auto d = boggle::Dictionary::from_words(words);
                 log_loaded(d, "word list");
                 return d;
             },
             py::arg("words"))
        .def_static("from_dawg", [](const string& path) {
                 auto d = boggle::Dictionary::from_packed_dawg(path);
                 log_loaded(d, path);
                 return d;
             },
             py::arg("path"), "Load a packed DAWG (words.dat)")
        .def("contains", &boggle::Dictionary::contains, py::arg("word"))
        .def("__contains__", &boggle::Dictionary::contains)
        .def("__len__", &boggle::Dictionary::num_words)
        .def_property_readonly("num_words", &boggle::Dictionary::num_words)
        .def_property_readonly("num_nodes", &boggle::Dictionary::num_nodes);

    py::class_<boggle::WordSet>(m, "WordSet")
        .def_property_readonly("words", &sorted_words)
        .def_readonly("score", &boggle::WordSet::score)
        .def_readonly("longest", &boggle::WordSet::longest)
        .def_readonly("count_by_length", &boggle::WordSet::count_by_length)
        .def("__len__", &boggle::WordSet::size)
        .def("__contains__", &boggle::WordSet::contains)
        .def("__iter__", [](const boggle::WordSet& ws) {
                 return py::make_iterator(ws.words.begin(), ws.words.end());
             },
             py::keep_alive<0, 1>())
        .def("__eq__", &boggle::WordSet::operator==);

    m.def("solve", &restore_py,
          py::arg("dictionary"), py::arg("board"), py::arg("width"), py::arg("height"),
          py::arg("scores"), py::arg("min_legal") = 3,
          "Find every legal word on a board given as a face string");
    m.def("restore_game", &restore_py,
          py::arg("dictionary"), py::arg("board"), py::arg("width"), py::arg("height"),
          py::arg("scores"), py::arg("min_legal") = 3,
          "Rebuild a saved board from its face string and solve it");
    m.def("fill_board", &fill_board_py,
          py::arg("dictionary"), py::arg("dice"), py::arg("scores"),
          py::arg("width"), py::arg("height"),
          py::arg("min_words") = 1, py::arg("max_words") = -1,
          py::arg("min_score") = 1, py::arg("max_score") = -1,
          py::arg("min_longest") = 3, py::arg("max_longest") = -1,
          py::arg("min_legal") = 3, py::arg("max_tries") = 100000,
          py::arg("random_seed") = 0,
          "Roll boards until one meets the bounds; returns (board, words, tries)");

    m.def("face_display", &boggle::face_display, py::arg("face"));
    m.def("dice_sets", []() {
        py::list out;
        for (const auto& s : boggle::builtin_dice_sets()) out.append(dice_set_tuple(s));
        return out;
    });
    m.def("get_dice_set", [](const string& name) -> py::object {
        const boggle::DiceSet* s = boggle::find_dice_set(name);
        if (!s) return py::none();
        return dice_set_tuple(*s);
    }, py::arg("name"));
}
