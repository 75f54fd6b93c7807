#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "BattingOrderPolicy.h"
#include "Collector.h"
#include "CricsheetReader.h"
#include "MatchSimulator.h"
#include "PartnershipLearner.h"
#include "StoreSerializer.h"


namespace py = pybind11;
using namespace wicketsim;


static std::unique_ptr<BattingOrderPolicy> make_policy(const std::string& split_expr) {
     if (split_expr.empty()) return std::make_unique<HalfSplitPolicy>();
     return std::make_unique<ExpressionSplitPolicy>(split_expr);
}


namespace wicketsim {
     struct PySimulator {
          std::unique_ptr<MatchSimulator> core;

          PySimulator(PartnershipStore store,
                      const int workers,
                      const int chunk,
                      const std::optional<uint64_t> seed,
                      const std::string& split_expr) {
               SimulationConfig config;
               config.numWorkers = workers;
               config.chunkSize = chunk;
               config.seed = seed;
               core = std::make_unique<MatchSimulator>(std::move(store), config, make_policy(split_expr));
          }

          py::tuple simulate_match(const double oversLeft, const int first, const int second, const int lead,
                                   const int n) const {
               OutcomeProbabilities p;
               {
                    py::gil_scoped_release release;
                    p = core->simulateMatch(oversLeft, first, second, lead, n);
               }
               return py::make_tuple(p.win, p.draw, p.loss);
          }

          py::tuple simulate_innings(const int wickets, const double overs, const uint64_t seed) const {
               RngEngine rng(seed);
               const auto r = core->simulateInnings(wickets, overs, rng);
               return py::make_tuple(r.runs, r.overs);
          }

          void run(const MatchState& state, const int n,
                   const std::vector<std::shared_ptr<TrialCollector>>& collectors) const {
               CollectorGroup group(collectors);
               {
                    py::gil_scoped_release release;
                    core->run(state, n, group);
               }
               for (size_t i = 0; i < collectors.size(); ++i)
                    collectors[i]->merge(*group.at(i));
          }
     };
}


PYBIND11_MODULE(_wicketsim, m) {
     m.doc() = "Monte Carlo cricket match simulator over wicket partnerships";

     py::class_<MatchState>(m, "MatchState")
          .def(py::init<double, int, int, int>(),
               py::arg("overs_left"),
               py::arg("first_wickets_remaining"),
               py::arg("second_wickets_remaining"),
               py::arg("lead")
          )
          .def_readwrite("overs_left", &MatchState::oversLeft)
          .def_readwrite("first_wickets_remaining", &MatchState::firstWicketsRemaining)
          .def_readwrite("second_wickets_remaining", &MatchState::secondWicketsRemaining)
          .def_readwrite("lead", &MatchState::lead)
          .def("is_terminal", &MatchState::isTerminal);

     py::class_<Delivery>(m, "Delivery")
          .def(py::init<>())
          .def(py::init([](const int runs, const int wickets) { return Delivery{runs, wickets}; }),
               py::arg("runs"),
               py::arg("wickets") = 0
          )
          .def_readwrite("runs", &Delivery::runs)
          .def_readwrite("wickets", &Delivery::wickets);

     py::class_<InningsRecord>(m, "InningsRecord")
          .def(py::init<>())
          .def(py::init([](std::vector<Delivery> deliveries) { return InningsRecord{std::move(deliveries)}; }),
               py::arg("deliveries"))
          .def_readwrite("deliveries", &InningsRecord::deliveries);

     py::class_<PartnershipStore>(m, "PartnershipStore")
          .def(py::init<>())
          .def("__len__", &PartnershipStore::size)
          .def("__contains__", &PartnershipStore::contains)
          .def("__eq__", [](const PartnershipStore& a, const PartnershipStore& b) { return a == b; })
          .def("overs_distribution", [](const PartnershipStore& s, const int wicket) {
               const auto* stats = s.find(wicket);
               if (!stats) throw py::key_error("no statistics for wicket " + std::to_string(wicket));
               return stats->overs.probabilities();
          }, py::arg("wicket"))
          .def("runs_distribution", [](const PartnershipStore& s, const int wicket) {
               const auto* stats = s.find(wicket);
               if (!stats) throw py::key_error("no statistics for wicket " + std::to_string(wicket));
               return stats->runs.probabilities();
          }, py::arg("wicket"));

     m.def("learn", [](const std::vector<InningsRecord>& corpus, const int workers, const double smoothing) {
               py::gil_scoped_release release;
               return learn(corpus, workers, LearnerConfig{smoothing});
          },
          py::arg("corpus"),
          py::arg("workers") = 1,
          py::arg("smoothing") = 1e-4);
     m.def("load_corpus", &loadCorpus, py::arg("paths"));
     m.def("load_corpus_directory", &loadCorpusDirectory, py::arg("directory"));
     m.def("save", &saveStore, py::arg("store"), py::arg("path"));
     m.def("load", &loadStore, py::arg("path"));

     py::register_exception<StoreFormatError>(m, "StoreFormatError", PyExc_ValueError);

     // TrialCollector base + subclasses
     py::class_<TrialCollector, std::shared_ptr<TrialCollector>>(m, "TrialCollector");

     py::class_<OutcomeCounter, TrialCollector, std::shared_ptr<OutcomeCounter>>(m, "OutcomeCounter")
          .def(py::init<>())
          .def_property_readonly("wins", &OutcomeCounter::wins)
          .def_property_readonly("draws", &OutcomeCounter::draws)
          .def_property_readonly("losses", &OutcomeCounter::losses)
          .def("probabilities", [](const OutcomeCounter& c) {
               const auto p = c.probabilities();
               return py::make_tuple(p.win, p.draw, p.loss);
          });

     py::class_<LeadHistogram, TrialCollector, std::shared_ptr<LeadHistogram>>(m, "LeadHistogram")
          .def(py::init<int, int, int>(),
               py::arg("lo"),
               py::arg("hi"),
               py::arg("bin_width")
          )
          .def("histogram", &LeadHistogram::histogram, py::return_value_policy::reference_internal)
          .def("bin_start", &LeadHistogram::binStart, py::arg("bin"));

     // Simulator
     py::class_<PySimulator, std::shared_ptr<PySimulator>>(m, "MatchSimulator")
          .def(py::init<PartnershipStore, int, int, std::optional<uint64_t>, std::string>(),
               py::arg("store"),
               py::arg("workers") = 1,
               py::arg("chunk_size") = 256,
               py::arg("seed") = py::none(),
               py::arg("split_expr") = "",
               "split_expr: overs for the side batting first, over overs_left, first_wickets, "
               "second_wickets and lead. Empty means half of overs_left."
          )
          .def("simulate_match", &PySimulator::simulate_match,
               py::arg("overs_left"),
               py::arg("first_wickets_remaining"),
               py::arg("second_wickets_remaining"),
               py::arg("lead"),
               py::arg("n_simulations") = 1000
          )
          .def("simulate_innings", &PySimulator::simulate_innings,
               py::arg("wickets_available"),
               py::arg("overs_budget"),
               py::arg("seed")
          )
          .def("run", &PySimulator::run,
               py::arg("state"),
               py::arg("n_simulations"),
               py::arg("collectors")
          );
}
