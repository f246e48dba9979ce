#include <iostream>
#include <mutex>

#include "movecount/app/options.hpp"
#include "movecount/app/quiz_console.hpp"
#include "movecount/app/text_board_renderer.hpp"
#include "movecount/corpus/corpus_error.hpp"
#include "movecount/corpus/position_corpus.hpp"
#include "movecount/quiz/quiz_session.hpp"
#include "movecount/quiz/tick_scheduler.hpp"

int main(int argc, char** argv)
{
  using namespace movecount;

  const app::Options opts = app::parseArgs(argc, argv);

  corpus::PositionCorpus corpus;
  try
  {
    corpus = corpus::PositionCorpus::loadFromFiles(opts.gamesPath, opts.weightsPath);
  }
  catch (const corpus::CorpusError &e)
  {
    std::cerr << "[Console] cannot load corpus: " << e.what() << "\n";
    return 1;
  }

  std::mutex serial;
  quiz::ThreadTickScheduler scheduler(serial);
  quiz::QuizSession session(corpus, scheduler, opts.quiz);
  app::TextBoardRenderer renderer(std::cout);
  app::QuizConsole console(session, renderer, serial, std::cout);
  return console.run(std::cin);
}
